#include "package/signer.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/pkcs7.h>
#include <openssl/x509.h>

#include "core/error.hpp"
#include "io/fs_utils.hpp"
#include "io/process.hpp"
#include "ndk/abi.hpp"

namespace fs = std::filesystem;

namespace droidpack::package
{
    namespace
    {

        constexpr const char *kSigningBlockMagic = "APK Sig Block 42";
        constexpr std::size_t kSigningBlockMagicSize = 16;
        constexpr std::size_t kChunkSize = 1024 * 1024;
        constexpr const char *kCreatedBy = "1.0 (droidpack)";

        // JAR manifest lines are limited to 72 bytes; longer ones continue
        // on the next line after a single space.
        constexpr std::size_t kManifestLineWidth = 72;

        using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
        using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
        using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
        using Pkcs7Ptr = std::unique_ptr<PKCS7, decltype(&PKCS7_free)>;
        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        std::string openSslError(const std::string &what)
        {
            const unsigned long code = ERR_get_error();
            ERR_clear_error();
            if (code == 0)
            {
                return what;
            }
            char buffer[256];
            ERR_error_string_n(code, buffer, sizeof(buffer));
            return what + " (" + buffer + ")";
        }

        class Sha256
        {
        public:
            Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
            {
                if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
                {
                    throw SigningError(openSslError("SHA-256 init failed"));
                }
            }

            void update(const std::uint8_t *data, std::size_t size)
            {
                if (EVP_DigestUpdate(ctx_.get(), data, size) != 1)
                {
                    throw SigningError(openSslError("SHA-256 update failed"));
                }
            }

            void update(const Bytes &data)
            {
                update(data.data(), data.size());
            }

            Bytes finish()
            {
                Bytes out(EVP_MAX_MD_SIZE);
                unsigned int size = 0;
                if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &size) != 1)
                {
                    throw SigningError(openSslError("SHA-256 final failed"));
                }
                out.resize(size);
                return out;
            }

        private:
            MdCtxPtr ctx_;
        };

        Bytes sha256(const Bytes &data)
        {
            Sha256 hash;
            hash.update(data);
            return hash.finish();
        }

        Bytes sha256(const std::string &text)
        {
            return sha256(Bytes(text.begin(), text.end()));
        }

        std::string base64(const Bytes &data)
        {
            std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
            const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data.data(),
                                                static_cast<int>(data.size()));
            out.resize(static_cast<std::size_t>(written));
            return out;
        }

        Bytes lengthPrefixed(const Bytes &data)
        {
            Bytes out;
            out.reserve(data.size() + 4);
            putU32(out, static_cast<std::uint32_t>(data.size()));
            putBytes(out, data);
            return out;
        }

        void writeAttribute(std::string &out, const std::string &name, const std::string &value)
        {
            const std::string line = name + ": " + value;
            out += line.substr(0, kManifestLineWidth);
            for (std::size_t at = kManifestLineWidth; at < line.size(); at += kManifestLineWidth - 1)
            {
                out += "\r\n ";
                out += line.substr(at, kManifestLineWidth - 1);
            }
            out += "\r\n";
        }

        bool isJarSignatureEntry(const std::string &name)
        {
            const std::string prefix = "META-INF/";
            if (name.rfind(prefix, 0) != 0 || name.find('/', prefix.size()) != std::string::npos)
            {
                return false;
            }
            if (name == "META-INF/MANIFEST.MF")
            {
                return true;
            }
            for (const char *suffix : {".SF", ".RSA", ".DSA", ".EC"})
            {
                const std::string ext(suffix);
                if (name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0)
                {
                    return true;
                }
            }
            return false;
        }

        template <typename T, typename Fn>
        Bytes toDer(T *object, Fn encode, const std::string &what)
        {
            const int size = encode(object, nullptr);
            if (size <= 0)
            {
                throw SigningError(openSslError("Failed encode " + what));
            }
            Bytes out(static_cast<std::size_t>(size));
            unsigned char *cursor = out.data();
            encode(object, &cursor);
            return out;
        }

        Bytes contentDigest(const Bytes &apk, std::size_t centralDirectory, std::size_t eocd)
        {
            const std::pair<std::size_t, std::size_t> sections[] = {
                {0, centralDirectory},
                {centralDirectory, eocd},
                {eocd, apk.size()},
            };

            Bytes chunkDigests;
            std::uint32_t chunkCount = 0;
            for (const auto &section : sections)
            {
                for (std::size_t at = section.first; at < section.second; at += kChunkSize)
                {
                    const std::size_t size = std::min(kChunkSize, section.second - at);
                    Bytes header = {0xa5};
                    putU32(header, static_cast<std::uint32_t>(size));

                    Sha256 chunk;
                    chunk.update(header);
                    chunk.update(apk.data() + at, size);
                    putBytes(chunkDigests, chunk.finish());
                    ++chunkCount;
                }
            }

            Bytes header = {0x5a};
            putU32(header, chunkCount);
            Sha256 top;
            top.update(header);
            top.update(chunkDigests);
            return top.finish();
        }

        Bytes signingBlock(std::uint32_t id, const Bytes &value)
        {
            Bytes pairs;
            putU64(pairs, 4 + value.size());
            putU32(pairs, id);
            putBytes(pairs, value);

            const std::uint64_t size = pairs.size() + 8 + kSigningBlockMagicSize;
            Bytes block;
            putU64(block, size);
            putBytes(block, pairs);
            putU64(block, size);
            putString(block, kSigningBlockMagic);
            return block;
        }

    } // namespace

    struct ApkSchemeSigner::Keys
    {
        PkeyPtr key{nullptr, &EVP_PKEY_free};
        X509Ptr certificate{nullptr, &X509_free};
        Bytes certificateDer;
        Bytes publicKeyDer;
        std::uint32_t algorithm = kSignatureRsaPkcs1Sha256;
        std::string jarSignatureExtension = ".RSA";

        Bytes sign(const Bytes &data) const
        {
            MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
            if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1)
            {
                throw SigningError(openSslError("Failed init signature"));
            }

            std::size_t size = 0;
            if (EVP_DigestSign(ctx.get(), nullptr, &size, data.data(), data.size()) != 1)
            {
                throw SigningError(openSslError("Failed size signature"));
            }
            Bytes out(size);
            if (EVP_DigestSign(ctx.get(), out.data(), &size, data.data(), data.size()) != 1)
            {
                throw SigningError(openSslError("Failed compute signature"));
            }
            out.resize(size);
            return out;
        }
    };

    ApkSchemeSigner::ApkSchemeSigner(const model::PemCredential &credential, int minSdk, const droidpack::Context &ctx)
        : keys_(std::make_unique<Keys>()), minSdk_(minSdk), ctx_(ctx)
    {
        std::error_code ec;
        if (!fs::is_regular_file(credential.privateKey, ec))
        {
            throw SigningError("private key not found: " + credential.privateKey.string());
        }
        if (!fs::is_regular_file(credential.certificate, ec))
        {
            throw SigningError("certificate not found: " + credential.certificate.string());
        }

        BioPtr keyBio(BIO_new_file(credential.privateKey.string().c_str(), "rb"), &BIO_free);
        if (!keyBio)
        {
            throw SigningError(openSslError("Failed open " + credential.privateKey.string()));
        }
        void *password = credential.password.empty() ? nullptr : const_cast<char *>(credential.password.c_str());
        keys_->key.reset(PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, password));
        if (!keys_->key)
        {
            throw SigningError(openSslError("Failed read private key " + credential.privateKey.string()));
        }

        BioPtr certBio(BIO_new_file(credential.certificate.string().c_str(), "rb"), &BIO_free);
        if (!certBio)
        {
            throw SigningError(openSslError("Failed open " + credential.certificate.string()));
        }
        keys_->certificate.reset(PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr));
        if (!keys_->certificate)
        {
            throw SigningError(openSslError("Failed read certificate " + credential.certificate.string()));
        }

        if (X509_check_private_key(keys_->certificate.get(), keys_->key.get()) != 1)
        {
            ERR_clear_error();
            throw SigningError("private key does not match certificate " + credential.certificate.string());
        }

        switch (EVP_PKEY_base_id(keys_->key.get()))
        {
        case EVP_PKEY_RSA:
            keys_->algorithm = kSignatureRsaPkcs1Sha256;
            keys_->jarSignatureExtension = ".RSA";
            break;
        case EVP_PKEY_EC:
            keys_->algorithm = kSignatureEcdsaSha256;
            keys_->jarSignatureExtension = ".EC";
            break;
        default:
            throw SigningError("unsupported key type in " + credential.privateKey.string());
        }

        keys_->certificateDer = toDer(keys_->certificate.get(), i2d_X509, "certificate");
        keys_->publicKeyDer = toDer(keys_->key.get(), i2d_PUBKEY, "public key");
    }

    ApkSchemeSigner::~ApkSchemeSigner() = default;

    bool ApkSchemeSigner::signsV1() const
    {
        return minSdk_ < ndk::kFirstV2SigningApi;
    }

    std::uint32_t ApkSchemeSigner::signatureAlgorithm() const
    {
        return keys_->algorithm;
    }

    Bytes ApkSchemeSigner::addJarSignature(const ZipReader &archive) const
    {
        std::string manifest;
        writeAttribute(manifest, "Manifest-Version", "1.0");
        writeAttribute(manifest, "Created-By", kCreatedBy);
        manifest += "\r\n";

        std::string signatureFile;
        writeAttribute(signatureFile, "Signature-Version", "1.0");
        writeAttribute(signatureFile, "Created-By", kCreatedBy);

        std::string sections;
        std::string signatureSections;
        for (const auto &entry : archive.entries())
        {
            if (isJarSignatureEntry(entry.name))
            {
                throw SigningError("archive already carries " + entry.name);
            }
            if (entry.name.back() == '/')
            {
                continue;
            }

            std::string section;
            writeAttribute(section, "Name", entry.name);
            writeAttribute(section, "SHA-256-Digest", base64(sha256(archive.read(entry))));
            section += "\r\n";
            sections += section;

            writeAttribute(signatureSections, "Name", entry.name);
            writeAttribute(signatureSections, "SHA-256-Digest", base64(sha256(section)));
            signatureSections += "\r\n";
        }
        manifest += sections;

        writeAttribute(signatureFile, "SHA-256-Digest-Manifest", base64(sha256(manifest)));
        // v2-aware verifiers then require the v2 block.
        writeAttribute(signatureFile, "X-Android-APK-Signed", "2");
        signatureFile += "\r\n";
        signatureFile += signatureSections;

        BioPtr content(BIO_new_mem_buf(signatureFile.data(), static_cast<int>(signatureFile.size())), &BIO_free);
        if (!content)
        {
            throw SigningError(openSslError("Failed wrap signature file"));
        }
        const int flags = PKCS7_DETACHED | PKCS7_BINARY | PKCS7_NOATTR | PKCS7_NOSMIMECAP;
        Pkcs7Ptr pkcs7(PKCS7_sign(keys_->certificate.get(), keys_->key.get(), nullptr, content.get(), flags),
                       &PKCS7_free);
        if (!pkcs7)
        {
            throw SigningError(openSslError("Failed create PKCS#7 signature"));
        }
        const Bytes block = toDer(pkcs7.get(), i2d_PKCS7, "PKCS#7 signature");

        ZipWriter writer = ZipWriter::appendTo(archive);
        writer.addDeflated("META-INF/MANIFEST.MF", Bytes(manifest.begin(), manifest.end()));
        writer.addDeflated("META-INF/CERT.SF", Bytes(signatureFile.begin(), signatureFile.end()));
        writer.addDeflated("META-INF/CERT" + keys_->jarSignatureExtension, block);
        return writer.finish();
    }

    Bytes ApkSchemeSigner::addV2Block(const ZipReader &archive) const
    {
        const Bytes &apk = archive.bytes();
        const std::size_t centralDirectory = archive.centralDirectoryOffset();
        const std::size_t eocd = static_cast<std::size_t>(archive.eocdOffset());

        Bytes digests;
        {
            Bytes item;
            putU32(item, keys_->algorithm);
            putBytes(item, lengthPrefixed(contentDigest(apk, centralDirectory, eocd)));
            putBytes(digests, lengthPrefixed(item));
        }

        Bytes signedData;
        putBytes(signedData, lengthPrefixed(digests));
        putBytes(signedData, lengthPrefixed(lengthPrefixed(keys_->certificateDer)));
        putBytes(signedData, lengthPrefixed(Bytes{}));

        Bytes signatures;
        {
            Bytes item;
            putU32(item, keys_->algorithm);
            putBytes(item, lengthPrefixed(keys_->sign(signedData)));
            putBytes(signatures, lengthPrefixed(item));
        }

        Bytes signerRecord;
        putBytes(signerRecord, lengthPrefixed(signedData));
        putBytes(signerRecord, lengthPrefixed(signatures));
        putBytes(signerRecord, lengthPrefixed(keys_->publicKeyDer));

        const Bytes block = signingBlock(kApkSignatureSchemeV2BlockId, lengthPrefixed(lengthPrefixed(signerRecord)));
        const std::uint64_t movedCentralDirectory = centralDirectory + block.size();
        if (movedCentralDirectory > 0xFFFFFFFFULL)
        {
            throw SigningError("signed archive too large for zip32");
        }

        Bytes out;
        out.reserve(apk.size() + block.size());
        out.insert(out.end(), apk.begin(), apk.begin() + static_cast<std::ptrdiff_t>(centralDirectory));
        putBytes(out, block);
        out.insert(out.end(), apk.begin() + static_cast<std::ptrdiff_t>(centralDirectory), apk.end());
        setU32(out, eocd + block.size() + 16, static_cast<std::uint32_t>(movedCentralDirectory));
        return out;
    }

    Bytes ApkSchemeSigner::signArchive(const Bytes &unsignedApk) const
    {
        const ZipReader archive(unsignedApk, "<unsigned apk>");
        if (findApkSigningBlock(archive).has_value())
        {
            throw SigningError("archive already carries an APK signing block");
        }

        if (!signsV1())
        {
            return addV2Block(archive);
        }
        const ZipReader jarSigned(addJarSignature(archive), "<jar signed apk>");
        return addV2Block(jarSigned);
    }

    void ApkSchemeSigner::sign(const fs::path &unsignedApk, const fs::path &outApk)
    {
        ctx_.log("Sign ", outApk.string(), signsV1() ? " (v1 + v2)" : " (v2)");
        io::writeBinaryFile(outApk, signArchive(io::readBinaryFile(unsignedApk)));
    }

    ApkSignerTool::ApkSignerTool(ToolRunner &runner, fs::path apksigner, model::KeystoreCredential credential)
        : runner_(runner), apksigner_(std::move(apksigner)), credential_(std::move(credential))
    {
    }

    std::vector<std::string> ApkSignerTool::arguments(const fs::path &in, const fs::path &out) const
    {
        std::vector<std::string> args = {"sign", "--ks", credential_.keystore.string()};
        if (!credential_.alias.empty())
        {
            args.push_back("--ks-key-alias");
            args.push_back(credential_.alias);
        }
        args.push_back("--ks-pass");
        args.push_back("pass:" + credential_.password);
        args.push_back("--in");
        args.push_back(in.string());
        args.push_back("--out");
        args.push_back(out.string());
        return args;
    }

    void ApkSignerTool::sign(const fs::path &unsignedApk, const fs::path &outApk)
    {
        std::error_code ec;
        if (!fs::is_regular_file(credential_.keystore, ec))
        {
            throw SigningError("keystore not found: " + credential_.keystore.string());
        }

        const auto args = arguments(unsignedApk, outApk);
        const auto result = runner_.run(apksigner_.string(), args, {});
        if (result.code != 0)
        {
            throw SigningError("apksigner exited with " + std::to_string(result.code) + ": " +
                               io::displayCommand(apksigner_.string(), args) +
                               (result.output.empty() ? std::string() : "\n" + result.output));
        }
    }

    std::optional<Bytes> findApkSigningBlock(const ZipReader &archive)
    {
        const Bytes &apk = archive.bytes();
        const std::size_t centralDirectory = archive.centralDirectoryOffset();
        const std::size_t footer = 8 + kSigningBlockMagicSize;
        if (centralDirectory < footer + 8)
        {
            return std::nullopt;
        }
        if (std::memcmp(apk.data() + centralDirectory - kSigningBlockMagicSize, kSigningBlockMagic,
                        kSigningBlockMagicSize) != 0)
        {
            return std::nullopt;
        }

        const std::uint64_t size = getU64(apk, centralDirectory - footer);
        if (size < footer || size + 8 > centralDirectory)
        {
            return std::nullopt;
        }
        const std::size_t start = centralDirectory - static_cast<std::size_t>(size) - 8;
        if (getU64(apk, start) != size)
        {
            return std::nullopt;
        }
        return Bytes(apk.begin() + static_cast<std::ptrdiff_t>(start),
                     apk.begin() + static_cast<std::ptrdiff_t>(centralDirectory));
    }

    std::optional<Bytes> findSigningBlockValue(const Bytes &block, std::uint32_t id)
    {
        if (block.size() < 16 + kSigningBlockMagicSize)
        {
            return std::nullopt;
        }
        const std::size_t end = block.size() - 8 - kSigningBlockMagicSize;
        std::size_t at = 8;
        while (at + 12 <= end)
        {
            const std::uint64_t length = getU64(block, at);
            if (length < 4 || at + 8 + length > end)
            {
                return std::nullopt;
            }
            if (getU32(block, at + 8) == id)
            {
                return Bytes(block.begin() + static_cast<std::ptrdiff_t>(at + 12),
                             block.begin() + static_cast<std::ptrdiff_t>(at + 8 + length));
            }
            at += 8 + static_cast<std::size_t>(length);
        }
        return std::nullopt;
    }

} // namespace droidpack::package
