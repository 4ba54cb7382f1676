#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../system/platform/platform.hpp"

namespace Porter {
namespace Resolver {
namespace Artifact {

using Porter::System::Platform::ArchClass;
using Porter::System::Platform::OsClass;
using Porter::System::Platform::PlatformKey;

enum class ArtifactFormat { DiskImage, Installer, AppImage };

struct ArtifactDescriptor {
    std::string    download_url;
    std::string    file_name;
    ArtifactFormat format = ArtifactFormat::AppImage;

    bool operator==(const ArtifactDescriptor& other) const {
        return download_url == other.download_url && file_name == other.file_name
               && format == other.format;
    }
};

class ArtifactResolver {
public:
    struct Entry {
        OsClass                  os;
        std::optional<ArchClass> arch;  // empty: any architecture
        ArtifactDescriptor       descriptor;
    };

    explicit ArtifactResolver(const std::string& version  = Core::Constants::BROWSER_VERSION,
                              const std::string& base_url = Core::Constants::RELEASE_BASE_URL);

    // First matching entry wins, so arch-specific rows precede the fallback row.
    std::optional<ArtifactDescriptor> resolve(const PlatformKey& key) const;

    const std::vector<Entry>& table() const { return table_; }

private:
    static std::vector<Entry> build_table(const std::string& version, const std::string& base_url);

    std::vector<Entry> table_;
};

}  // namespace Artifact
}  // namespace Resolver
}  // namespace Porter
