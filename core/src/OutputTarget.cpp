#include "fo/core/io/OutputTarget.hpp"

#include "fo/core/io/ZarrVolume.hpp"
#include "fo/core/util/Errors.hpp"
#include "fo/core/util/Logging.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace fo {

// ============================================================================
// MemoryOutputTarget
// ============================================================================

VolumeAccessor& MemoryOutputTarget::createMap(const std::string& name, const VolumeInfo& info)
{
    if (committed_) {
        throw IOError("MemoryOutputTarget: cannot create '" + name + "' after commit");
    }
    auto& slot = staged_[name];
    slot = std::make_unique<MemoryVolume>(info);
    return *slot;
}

void MemoryOutputTarget::addDocument(const std::string& name, const nlohmann::json& doc)
{
    stagedDocs_[name] = doc;
}

void MemoryOutputTarget::commit()
{
    for (auto& [name, vol] : staged_) {
        vol->close();
        published_[name] = std::move(vol);
    }
    for (auto& [name, doc] : stagedDocs_) {
        publishedDocs_[name] = std::move(doc);
    }
    staged_.clear();
    stagedDocs_.clear();
    committed_ = true;
}

void MemoryOutputTarget::discard()
{
    staged_.clear();
    stagedDocs_.clear();
}

std::vector<std::string> MemoryOutputTarget::names() const
{
    std::vector<std::string> out;
    for (const auto& [name, vol] : published_) {
        out.push_back(name);
    }
    return out;
}

const MemoryVolume& MemoryOutputTarget::map(const std::string& name) const
{
    auto it = published_.find(name);
    if (it == published_.end()) {
        throw IOError("MemoryOutputTarget: no published map '" + name + "'");
    }
    return *it->second;
}

const nlohmann::json& MemoryOutputTarget::document(const std::string& name) const
{
    auto it = publishedDocs_.find(name);
    if (it == publishedDocs_.end()) {
        throw IOError("MemoryOutputTarget: no published document '" + name + "'");
    }
    return it->second;
}

// ============================================================================
// ZarrOutputTarget
// ============================================================================

ZarrOutputTarget::ZarrOutputTarget(fs::path root, bool overwrite, std::vector<std::size_t> chunks)
    : root_(std::move(root))
    , staging_(root_.string() + ".staging")
    , overwrite_(overwrite)
    , chunks_(std::move(chunks))
{
    if (fs::exists(root_) && !overwrite_) {
        throw ConfigurationError("output " + root_.string() +
                                 " already exists (use overwrite to replace it)");
    }

    std::error_code ec;
    fs::remove_all(staging_, ec);
    fs::create_directories(staging_, ec);
    if (ec) {
        throw IOError("cannot create staging directory " + staging_.string() + ": " + ec.message());
    }

    std::ofstream zgroup(staging_ / ".zgroup");
    zgroup << nlohmann::json{{"zarr_format", 2}}.dump(2);
    if (!zgroup) {
        throw IOError("cannot write " + (staging_ / ".zgroup").string());
    }
}

ZarrOutputTarget::~ZarrOutputTarget()
{
    if (committed_ || discarded_) {
        return;
    }
    try {
        discard();
    } catch (const std::exception& e) {
        Logger()->error("failed to remove staging directory {}: {}", staging_.string(), e.what());
    }
}

VolumeAccessor& ZarrOutputTarget::createMap(const std::string& name, const VolumeInfo& info)
{
    if (committed_ || discarded_) {
        throw IOError("ZarrOutputTarget: cannot create '" + name + "' on a finished target");
    }
    auto& slot = maps_[name];
    slot = ZarrVolume::create(staging_ / name, info, chunks_);
    return *slot;
}

void ZarrOutputTarget::addDocument(const std::string& name, const nlohmann::json& doc)
{
    if (name == "attributes") {
        std::ofstream f(staging_ / ".zattrs");
        f << doc.dump(2);
        if (!f) throw IOError("cannot write group attributes");
        return;
    }
    std::ofstream f(staging_ / (name + ".json"));
    f << doc.dump(2);
    if (!f) {
        throw IOError("cannot write " + name + ".json");
    }
}

void ZarrOutputTarget::closeMaps()
{
    for (auto& [name, vol] : maps_) {
        vol->close();
    }
    maps_.clear();
}

void ZarrOutputTarget::commit()
{
    closeMaps();

    std::error_code ec;
    fs::path previous;
    if (fs::exists(root_)) {
        if (!overwrite_) {
            throw IOError("output " + root_.string() + " appeared during the run");
        }
        // The old group is restored if publishing fails.
        previous = root_.string() + ".previous";
        fs::remove_all(previous, ec);
        fs::rename(root_, previous, ec);
        if (ec) {
            throw IOError("cannot move " + root_.string() + " aside: " + ec.message());
        }
    }

    fs::rename(staging_, root_, ec);
    if (ec) {
        const std::string reason = ec.message();
        if (!previous.empty()) {
            std::error_code restore;
            fs::rename(previous, root_, restore);
            if (restore) {
                Logger()->error("cannot restore {} from {}: {}", root_.string(), previous.string(),
                                restore.message());
            }
        }
        throw IOError("cannot publish " + root_.string() + ": " + reason);
    }
    committed_ = true;

    if (!previous.empty()) {
        fs::remove_all(previous, ec);
        if (ec) {
            Logger()->warn("published {} but could not remove {}: {}", root_.string(),
                           previous.string(), ec.message());
        }
    }
    Logger()->info("published output maps to {}", root_.string());
}

void ZarrOutputTarget::discard()
{
    closeMaps();
    std::error_code ec;
    fs::remove_all(staging_, ec);
    discarded_ = true;
    if (ec) {
        throw IOError("cannot remove " + staging_.string() + ": " + ec.message());
    }
}

}  // namespace fo
