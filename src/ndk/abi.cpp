#include "ndk/abi.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "core/error.hpp"

namespace droidpack::ndk
{
    namespace
    {

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        constexpr const char *kSystemLibraries[] = {
            "libEGL.so",
            "libGLESv1_CM.so",
            "libGLESv2.so",
            "libGLESv3.so",
            "libOpenMAXAL.so",
            "libOpenSLES.so",
            "libaaudio.so",
            "libamidi.so",
            "libandroid.so",
            "libbinder_ndk.so",
            "libc.so",
            "libcamera2ndk.so",
            "libdl.so",
            "libjnigraphics.so",
            "liblog.so",
            "libm.so",
            "libmediandk.so",
            "libnativewindow.so",
            "libneuralnetworks.so",
            "libstdc++.so",
            "libsync.so",
            "libvulkan.so",
            "libz.so",
        };

    } // namespace

    const std::array<Abi, 4> &allAbis()
    {
        static const std::array<Abi, 4> abis = {Abi::ArmV7a, Abi::Arm64V8a, Abi::X86, Abi::X86_64};
        return abis;
    }

    Abi parseAbi(const std::string &name)
    {
        const std::string key = lower(name);
        if (key == "armeabi-v7a" || key == "armv7" || key == "armv7a" || key == "arm")
        {
            return Abi::ArmV7a;
        }
        if (key == "arm64-v8a" || key == "arm64" || key == "aarch64")
        {
            return Abi::Arm64V8a;
        }
        if (key == "x86" || key == "i686")
        {
            return Abi::X86;
        }
        if (key == "x86_64" || key == "x86-64")
        {
            return Abi::X86_64;
        }
        throw UnsupportedAbi(name);
    }

    std::string tripleFor(Abi abi)
    {
        switch (abi)
        {
        case Abi::ArmV7a:
            return "arm-linux-androideabi";
        case Abi::Arm64V8a:
            return "aarch64-linux-android";
        case Abi::X86:
            return "i686-linux-android";
        case Abi::X86_64:
            return "x86_64-linux-android";
        }
        throw UnsupportedAbi(std::to_string(static_cast<int>(abi)));
    }

    std::string clangTargetFor(Abi abi)
    {
        switch (abi)
        {
        case Abi::ArmV7a:
            return "armv7a-linux-androideabi";
        case Abi::Arm64V8a:
            return "aarch64-linux-android";
        case Abi::X86:
            return "i686-linux-android";
        case Abi::X86_64:
            return "x86_64-linux-android";
        }
        throw UnsupportedAbi(std::to_string(static_cast<int>(abi)));
    }

    std::string packageDirFor(Abi abi)
    {
        switch (abi)
        {
        case Abi::ArmV7a:
            return "armeabi-v7a";
        case Abi::Arm64V8a:
            return "arm64-v8a";
        case Abi::X86:
            return "x86";
        case Abi::X86_64:
            return "x86_64";
        }
        throw UnsupportedAbi(std::to_string(static_cast<int>(abi)));
    }

    std::string shortNameFor(Abi abi)
    {
        switch (abi)
        {
        case Abi::ArmV7a:
            return "armv7";
        case Abi::Arm64V8a:
            return "arm64";
        case Abi::X86:
            return "x86";
        case Abi::X86_64:
            return "x86_64";
        }
        throw UnsupportedAbi(std::to_string(static_cast<int>(abi)));
    }

    int defaultMinApi()
    {
        return kMinSupportedApi;
    }

    int maxKnownApi()
    {
        return kMaxKnownApi;
    }

    std::string hostTag()
    {
#ifdef _WIN32
        return "windows-x86_64";
#elif __APPLE__
        // Apple silicon hosts still run the x86_64 prebuilts.
        return "darwin-x86_64";
#else
        return "linux-x86_64";
#endif
    }

    bool isSystemLibrary(const std::string &fileName)
    {
        return std::find(std::begin(kSystemLibraries), std::end(kSystemLibraries), fileName) != std::end(kSystemLibraries);
    }

} // namespace droidpack::ndk
