#include "fo/core/util/Errors.hpp"

#include <sstream>

namespace fo {

PipelineError::PipelineError(const std::string& msg) : std::runtime_error(msg) {}

PipelineError::PipelineError(std::vector<TileFailure> failures)
    : std::runtime_error(describe(failures)), failures_(std::move(failures))
{
}

std::string PipelineError::describe(const std::vector<TileFailure>& failures)
{
    std::ostringstream oss;
    oss << "pipeline failed: " << failures.size() << " tile(s) could not be processed";
    for (const auto& f : failures) {
        oss << "\n  tile " << f.tileId << " [" << f.state << "] after "
            << f.attempts << " attempt(s): " << f.message;
    }
    return oss.str();
}

PipelineCancelled::PipelineCancelled(std::size_t mergedTiles, std::size_t totalTiles)
    : PipelineError("pipeline cancelled after " + std::to_string(mergedTiles) + " of " +
                    std::to_string(totalTiles) + " tiles")
{
}

}  // namespace fo
