#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fo/core/io/MemoryVolume.hpp"
#include "fo/core/io/VolumeAccessor.hpp"

namespace fo {

/**
 * @brief Destination for a run's output maps.
 *
 * Maps are staged while the run is in progress and only become visible
 * through commit(). discard() drops everything staged so far; a failed
 * run never leaves a partial map set behind.
 */
class OutputTarget {
public:
    virtual ~OutputTarget() = default;

    /// Create a staged map. The target keeps ownership.
    virtual VolumeAccessor& createMap(const std::string& name, const VolumeInfo& info) = 0;

    /// Attach a JSON document (run parameters, run report) to the output set.
    virtual void addDocument(const std::string& name, const nlohmann::json& doc) = 0;

    virtual void commit() = 0;
    virtual void discard() = 0;
    virtual bool committed() const = 0;
};

/**
 * @brief Keeps output maps in memory; published maps are readable via map().
 */
class MemoryOutputTarget : public OutputTarget {
public:
    VolumeAccessor& createMap(const std::string& name, const VolumeInfo& info) override;
    void addDocument(const std::string& name, const nlohmann::json& doc) override;
    void commit() override;
    void discard() override;
    bool committed() const override { return committed_; }

    bool has(const std::string& name) const { return published_.count(name) > 0; }
    std::vector<std::string> names() const;

    /// Published map; throws fo::IOError if no such map was committed.
    const MemoryVolume& map(const std::string& name) const;
    const nlohmann::json& document(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<MemoryVolume>> staged_;
    std::map<std::string, std::unique_ptr<MemoryVolume>> published_;
    std::map<std::string, nlohmann::json> stagedDocs_;
    std::map<std::string, nlohmann::json> publishedDocs_;
    bool committed_ = false;
};

/**
 * @brief Writes a zarr group of output maps.
 *
 * Maps are written under "<root>.staging" and the directory is renamed
 * to root on commit. With overwrite, an existing root is first renamed
 * to "<root>.previous", restored if publishing fails, and removed once
 * the new group is in place. Documents are written as "<name>.json"
 * inside the group.
 */
class ZarrOutputTarget : public OutputTarget {
public:
    /**
     * @param root Output group path
     * @param overwrite Replace an existing root on commit
     * @param chunks Spatial chunk shape used for every map
     * @throws fo::ConfigurationError if root exists and overwrite is false
     * @throws fo::IOError if the staging directory cannot be created
     */
    ZarrOutputTarget(
        std::filesystem::path root,
        bool overwrite = false,
        std::vector<std::size_t> chunks = {64, 64, 64});
    ~ZarrOutputTarget() override;

    ZarrOutputTarget(const ZarrOutputTarget&) = delete;
    ZarrOutputTarget& operator=(const ZarrOutputTarget&) = delete;

    VolumeAccessor& createMap(const std::string& name, const VolumeInfo& info) override;
    void addDocument(const std::string& name, const nlohmann::json& doc) override;
    void commit() override;
    void discard() override;
    bool committed() const override { return committed_; }

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& stagingPath() const { return staging_; }

private:
    void closeMaps();

    std::filesystem::path root_;
    std::filesystem::path staging_;
    bool overwrite_;
    std::vector<std::size_t> chunks_;
    std::map<std::string, std::unique_ptr<VolumeAccessor>> maps_;
    bool committed_ = false;
    bool discarded_ = false;
};

}  // namespace fo
