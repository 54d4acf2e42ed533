#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/config.hpp"
#include "package/tools.hpp"
#include "package/zip.hpp"

namespace droidpack::package {

constexpr std::uint32_t kApkSignatureSchemeV2BlockId = 0x7109871a;
constexpr std::uint32_t kSignatureRsaPkcs1Sha256 = 0x0103;
constexpr std::uint32_t kSignatureEcdsaSha256 = 0x0201;

class Signer {
public:
    virtual ~Signer() = default;

    // Reads unsignedApk and writes the signed archive to outApk. Throws SigningError.
    virtual void sign(const std::filesystem::path &unsignedApk, const std::filesystem::path &outApk) = 0;
};

// Signs in-process with OpenSSL. JAR signature entries are added when the
// package still targets devices older than API 24, then a v2 block is inserted.
class ApkSchemeSigner : public Signer {
public:
    ApkSchemeSigner(const model::PemCredential &credential, int minSdk, const droidpack::Context &ctx);
    ~ApkSchemeSigner() override;

    ApkSchemeSigner(const ApkSchemeSigner &) = delete;
    ApkSchemeSigner &operator=(const ApkSchemeSigner &) = delete;

    void sign(const std::filesystem::path &unsignedApk, const std::filesystem::path &outApk) override;

    Bytes signArchive(const Bytes &unsignedApk) const;

    bool signsV1() const;
    std::uint32_t signatureAlgorithm() const;

private:
    struct Keys;

    Bytes addJarSignature(const ZipReader &archive) const;
    Bytes addV2Block(const ZipReader &archive) const;

    std::unique_ptr<Keys> keys_;
    int minSdk_;
    const droidpack::Context &ctx_;
};

// Delegates to the build-tools apksigner with a keystore.
class ApkSignerTool : public Signer {
public:
    ApkSignerTool(ToolRunner &runner, std::filesystem::path apksigner, model::KeystoreCredential credential);

    void sign(const std::filesystem::path &unsignedApk, const std::filesystem::path &outApk) override;

    std::vector<std::string> arguments(const std::filesystem::path &in, const std::filesystem::path &out) const;

private:
    ToolRunner &runner_;
    std::filesystem::path apksigner_;
    model::KeystoreCredential credential_;
};

// The "APK Sig Block 42" block sitting right before the central directory, if any.
std::optional<Bytes> findApkSigningBlock(const ZipReader &archive);

// Value stored under id in a signing block.
std::optional<Bytes> findSigningBlockValue(const Bytes &block, std::uint32_t id);

} // namespace droidpack::package
