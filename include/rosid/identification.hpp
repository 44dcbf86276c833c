#pragma once

#include <rosid/result.hpp>
#include <rosid/config.hpp>
#include <rosid/descriptor.hpp>
#include <rosid/manifest_cache.hpp>
#include <string>
#include <vector>

namespace rosid {

// Type family claimed by ROS packages ("ros.<build_type>")
inline constexpr const char* ROS_FAMILY = "ros";

// Outcome of offering a location to an identification extension
enum class Identification {
    NotIdentified,   // not claimed; other extensions may try
    Identified,      // descriptor was populated
    IgnoreLocation,  // claim nothing here and do not descend further
};

const char* identification_name(Identification id);

class PackageIdentification {
public:
    virtual ~PackageIdentification() = default;

    // Extensions are consulted in descending priority
    virtual int priority() const = 0;
    virtual const char* name() const = 0;

    // Errors are reserved for broken invariants, not for "no package here"
    virtual Result<Identification> identify(PackageDescriptor& desc) = 0;
};

class PackageAugmentation {
public:
    virtual ~PackageAugmentation() = default;

    // Runs once over the complete batch after every identify() call finished
    virtual Status augment_packages(std::vector<PackageDescriptor>& descs) = 0;
};

// Identifies packages by their package.xml and expands group dependencies
// across a batch.
class RosPackageIdentification : public PackageIdentification,
                                 public PackageAugmentation {
public:
    // Must rank above the plain CMake and Python identifications
    static constexpr int PRIORITY = 150;

    explicit RosPackageIdentification(ManifestCache& cache,
                                      IdentificationConfig config = {});

    int priority() const override { return PRIORITY; }
    const char* name() const override { return "ros"; }

    Result<Identification> identify(PackageDescriptor& desc) override;
    Status augment_packages(std::vector<PackageDescriptor>& descs) override;

private:
    ManifestCache& cache_;
    IdentificationConfig config_;
};

// Skips directories containing a COLCON_IGNORE file
class IgnoreMarkerIdentification : public PackageIdentification {
public:
    static constexpr int PRIORITY = 1000;

    explicit IgnoreMarkerIdentification(std::string marker = "COLCON_IGNORE")
        : marker_(std::move(marker)) {}

    int priority() const override { return PRIORITY; }
    const char* name() const override { return "ignore"; }

    Result<Identification> identify(PackageDescriptor& desc) override;

private:
    std::string marker_;
};

} // namespace rosid
