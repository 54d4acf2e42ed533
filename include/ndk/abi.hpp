#pragma once

#include <array>
#include <string>

namespace droidpack::ndk {

enum class Abi {
    ArmV7a,
    Arm64V8a,
    X86,
    X86_64,
};

constexpr int kMinSupportedApi = 21;
constexpr int kMaxKnownApi = 34;

// First API level that verifies APK Signature Scheme v2.
constexpr int kFirstV2SigningApi = 24;

const std::array<Abi, 4> &allAbis();

// Accepts "arm64-v8a", "arm64" and "aarch64" style names. Throws UnsupportedAbi.
Abi parseAbi(const std::string &name);

// GNU triple used by binutils-style tools: aarch64-linux-android.
std::string tripleFor(Abi abi);
// Clang target prefix; the API level is appended to it: armv7a-linux-androideabi.
std::string clangTargetFor(Abi abi);
// Directory name under lib/ inside the APK: arm64-v8a.
std::string packageDirFor(Abi abi);
std::string shortNameFor(Abi abi);

int defaultMinApi();
int maxKnownApi();

// Prebuilt directory of the machine running the build, e.g. linux-x86_64.
std::string hostTag();

// Libraries shipped by the platform itself; never embedded in an APK.
bool isSystemLibrary(const std::string &fileName);

} // namespace droidpack::ndk
