#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "core/context.hpp"

namespace droidpack::ndk {

// The parts of an Android SDK the packager drives: build-tools and android.jar.
class SdkInstallation {
public:
    const std::filesystem::path &root() const { return root_; }
    const std::string &buildToolsVersion() const { return buildToolsVersion_; }

    // build-tools/<version>/<name>; throws ToolMissing.
    std::filesystem::path buildTool(const std::string &name) const;
    // platforms/android-<api>/android.jar; throws ToolMissing.
    std::filesystem::path androidJar(int api) const;
    std::optional<int> highestPlatform() const;

private:
    SdkInstallation(std::filesystem::path root, std::string buildToolsVersion)
        : root_(std::move(root)), buildToolsVersion_(std::move(buildToolsVersion)) {}

    friend SdkInstallation validateSdk(const std::filesystem::path &path, const std::string &preferredBuildTools);

    std::filesystem::path root_;
    std::string buildToolsVersion_;
};

// Uses preferredBuildTools when installed, otherwise the newest build-tools.
SdkInstallation validateSdk(const std::filesystem::path &path, const std::string &preferredBuildTools = "");

std::optional<std::filesystem::path> locateSdk(const droidpack::Context &ctx);

} // namespace droidpack::ndk
