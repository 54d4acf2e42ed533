#include "model/config.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "core/error.hpp"
#include "io/json_reader.hpp"
#include "package/zip.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace droidpack::model
{

    namespace
    {

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::optional<std::string> optString(const json &node, const std::string &key)
        {
            if (!node.contains(key) || node[key].is_null())
            {
                return std::nullopt;
            }
            if (!node[key].is_string())
            {
                throw ConfigError("field " + key + " must be a string");
            }
            return node[key].get<std::string>();
        }

        std::optional<int> optInt(const json &node, const std::string &key)
        {
            if (!node.contains(key) || node[key].is_null())
            {
                return std::nullopt;
            }
            if (!node[key].is_number_integer())
            {
                throw ConfigError("field " + key + " must be an integer");
            }
            return node[key].get<int>();
        }

        std::optional<bool> optBool(const json &node, const std::string &key)
        {
            if (!node.contains(key) || node[key].is_null())
            {
                return std::nullopt;
            }
            if (!node[key].is_boolean())
            {
                throw ConfigError("field " + key + " must be true or false");
            }
            return node[key].get<bool>();
        }

        std::vector<std::string> toStringList(const json &node, const std::string &key)
        {
            std::vector<std::string> out;
            if (!node.contains(key))
            {
                return out;
            }
            if (!node[key].is_array())
            {
                throw ConfigError("field " + key + " must be a list of strings");
            }

            for (const auto &item : node[key])
            {
                if (!item.is_string())
                {
                    throw ConfigError("field " + key + " must be a list of strings");
                }
                out.push_back(item.get<std::string>());
            }
            return out;
        }

        std::map<std::string, std::string> toStringMap(const json &node, const std::string &what)
        {
            std::map<std::string, std::string> out;
            if (!node.is_object())
            {
                throw ConfigError(what + " must be an object");
            }

            for (auto it = node.begin(); it != node.end(); ++it)
            {
                if (!it.value().is_string())
                {
                    throw ConfigError(what + "." + it.key() + " must be a string");
                }
                out[it.key()] = it.value().get<std::string>();
            }
            return out;
        }

        const json &childArray(const json &node, const std::string &key)
        {
            static const json empty = json::array();
            if (!node.contains(key))
            {
                return empty;
            }
            if (!node[key].is_array())
            {
                throw ConfigError("field " + key + " must be a list");
            }
            return node[key];
        }

        std::vector<MetaData> parseMetaData(const json &node)
        {
            std::vector<MetaData> out;
            for (const auto &item : childArray(node, "MetaData"))
            {
                MetaData meta;
                meta.name = optString(item, "Name").value_or("");
                meta.value = optString(item, "Value");
                meta.resource = optString(item, "Resource");
                out.push_back(meta);
            }
            return out;
        }

        IntentFilter parseIntentFilter(const json &node)
        {
            IntentFilter out;
            out.actions = toStringList(node, "Actions");
            out.categories = toStringList(node, "Categories");
            for (const auto &item : childArray(node, "Data"))
            {
                out.data.push_back(toStringMap(item, "Data"));
            }
            return out;
        }

        Component parseComponent(const json &node)
        {
            if (!node.is_object())
            {
                throw ConfigError("component entry must be an object");
            }

            Component out;
            out.kind = parseComponentKind(lower(optString(node, "Kind").value_or("activity")));
            out.name = optString(node, "Name").value_or("");
            if (node.contains("Attributes"))
            {
                out.attributes = toStringMap(node["Attributes"], "Attributes");
            }
            out.metaData = parseMetaData(node);
            for (const auto &filter : childArray(node, "IntentFilters"))
            {
                out.intentFilters.push_back(parseIntentFilter(filter));
            }
            return out;
        }

        UsesFeature parseFeature(const json &node)
        {
            UsesFeature out;
            if (node.is_string())
            {
                out.name = node.get<std::string>();
                return out;
            }
            if (!node.is_object())
            {
                throw ConfigError("feature entry must be a string or an object");
            }
            out.name = optString(node, "Name");
            out.glEsVersion = optInt(node, "GlEsVersion");
            out.required = optBool(node, "Required").value_or(true);
            return out;
        }

        fs::path resolvePath(const fs::path &baseDir, const std::optional<std::string> &value)
        {
            if (!value.has_value() || value->empty())
            {
                return {};
            }
            fs::path out(value.value());
            if (!out.is_absolute())
            {
                out = baseDir / out;
            }
            return out.lexically_normal();
        }

        std::optional<int> parsePlatform(const json &node)
        {
            if (!node.contains("Platform") || node["Platform"].is_null())
            {
                return std::nullopt;
            }
            if (node["Platform"].is_number_integer())
            {
                return node["Platform"].get<int>();
            }
            if (node["Platform"].is_string())
            {
                // "android-33" or "33"
                std::string text = node["Platform"].get<std::string>();
                if (text.rfind("android-", 0) == 0)
                {
                    text = text.substr(8);
                }
                if (!text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                                 { return std::isdigit(c) != 0; }))
                {
                    return std::stoi(text);
                }
            }
            throw ConfigError("Toolchain.Platform must look like android-<N>");
        }

        SigningConfig parseSigning(const json &node, const fs::path &baseDir)
        {
            SigningConfig out;
            if (!node.is_object())
            {
                throw ConfigError("Signing must be an object");
            }

            if (node.contains("Keystore"))
            {
                KeystoreCredential ks;
                ks.keystore = resolvePath(baseDir, optString(node, "Keystore"));
                ks.password = optString(node, "Password").value_or("");
                ks.alias = optString(node, "Alias").value_or("");
                out.keystore = ks;
            }
            if (node.contains("Key") || node.contains("Certificate"))
            {
                PemCredential pem;
                pem.privateKey = resolvePath(baseDir, optString(node, "Key"));
                pem.certificate = resolvePath(baseDir, optString(node, "Certificate"));
                pem.password = optString(node, "KeyPassword").value_or("");
                out.pem = pem;
            }
            return out;
        }

    } // namespace

    StripConfig parseStripConfig(const std::string &text)
    {
        const std::string key = lower(text);
        if (key.empty() || key == "default")
        {
            return StripConfig::Default;
        }
        if (key == "strip")
        {
            return StripConfig::Strip;
        }
        if (key == "split")
        {
            return StripConfig::Split;
        }
        throw ConfigError("unknown strip mode '" + text + "'");
    }

    ManifestOverrides parseManifestOverrides(const json &node)
    {
        ManifestOverrides out;
        if (!node.is_object())
        {
            throw ConfigError("Package must be an object");
        }

        out.package = optString(node, "Id");
        out.sharedUserId = optString(node, "SharedUserId");
        out.versionCode = optInt(node, "VersionCode");
        out.versionName = optString(node, "VersionName");
        out.minSdk = optInt(node, "MinSdk");
        out.targetSdk = optInt(node, "TargetSdk");
        out.maxSdk = optInt(node, "MaxSdk");

        for (const auto &permission : toStringList(node, "Permissions"))
        {
            out.permissions.insert(permission);
        }
        for (const auto &feature : childArray(node, "Features"))
        {
            out.features.insert(parseFeature(feature));
        }

        if (node.contains("Application"))
        {
            const json &app = node["Application"];
            if (!app.is_object())
            {
                throw ConfigError("Package.Application must be an object");
            }
            out.label = optString(app, "Label");
            out.icon = optString(app, "Icon");
            out.theme = optString(app, "Theme");
            out.debuggable = optBool(app, "Debuggable");
            out.hasCode = optBool(app, "HasCode");
            out.extractNativeLibs = optBool(app, "ExtractNativeLibs");
            out.usesCleartextTraffic = optBool(app, "UsesCleartextTraffic");
            out.applicationMetaData = parseMetaData(app);
            out.applicationExtraXml = toStringList(app, "ExtraXml");
        }

        for (const auto &component : childArray(node, "Components"))
        {
            out.components.push_back(parseComponent(component));
        }
        out.extraXml = toStringList(node, "ExtraXml");
        return out;
    }

    PackageConfig parsePackageConfig(const json &root, const fs::path &baseDir)
    {
        PackageConfig out;
        out.name = optString(root, "Name").value_or("app");
        if (root.contains("Package"))
        {
            out.manifest = parseManifestOverrides(root["Package"]);
        }

        if (root.contains("Toolchain"))
        {
            const json &tc = root["Toolchain"];
            if (!tc.is_object())
            {
                throw ConfigError("Toolchain must be an object");
            }
            out.toolchain.androidSdk = resolvePath(baseDir, optString(tc, "AndroidSdk"));
            out.toolchain.androidNdk = resolvePath(baseDir, optString(tc, "AndroidNdk"));
            out.toolchain.buildTools = optString(tc, "BuildTools").value_or("");
            out.toolchain.platform = parsePlatform(tc);
        }

        for (const auto &item : childArray(root, "Libraries"))
        {
            if (!item.is_object())
            {
                throw ConfigError("Libraries entries must be objects");
            }
            LibrarySpec lib;
            lib.abi = ndk::parseAbi(optString(item, "Abi").value_or(""));
            lib.path = resolvePath(baseDir, optString(item, "Path"));
            if (lib.path.empty())
            {
                throw ConfigError("library entry without Path");
            }
            out.libraries.push_back(lib);
        }

        out.resources = resolvePath(baseDir, optString(root, "Resources"));
        out.assets = resolvePath(baseDir, optString(root, "Assets"));
        out.output = resolvePath(baseDir, optString(root, "Output"));
        out.buildDir = resolvePath(baseDir, optString(root, "BuildDir"));
        if (out.buildDir.empty())
        {
            out.buildDir = (baseDir / "build").lexically_normal();
        }
        if (out.output.empty())
        {
            out.output = out.buildDir / (out.name + ".apk");
        }

        if (root.contains("Signing"))
        {
            out.signing = parseSigning(root["Signing"], baseDir);
        }

        out.strip = parseStripConfig(optString(root, "Strip").value_or(""));
        out.disableCompression = optBool(root, "DisableCompression").value_or(false);
        out.compressNativeLibraries = optBool(root, "CompressNativeLibraries").value_or(false);

        const int alignment = optInt(root, "NativeLibraryAlignment").value_or(4);
        if (alignment <= 0 || (alignment & (alignment - 1)) != 0 || alignment % 4 != 0 ||
            alignment > static_cast<int>(package::kMaxEntryAlignment))
        {
            throw ConfigError("NativeLibraryAlignment must be a power of two, a multiple of 4 and at most " +
                              std::to_string(package::kMaxEntryAlignment));
        }
        out.nativeLibraryAlignment = static_cast<std::uint32_t>(alignment);

        const std::string clamp = lower(optString(root, "ApiClamp").value_or("clamp"));
        if (clamp == "clamp")
        {
            out.apiClamp = ndk::ClampPolicy::Clamp;
        }
        else if (clamp == "reject")
        {
            out.apiClamp = ndk::ClampPolicy::Reject;
        }
        else
        {
            throw ConfigError("ApiClamp must be clamp or reject");
        }

        return out;
    }

    PackageConfig loadPackageConfig(const fs::path &configFile)
    {
        const json root = io::loadJsonFile(configFile);
        return parsePackageConfig(root, fs::absolute(configFile).parent_path());
    }

} // namespace droidpack::model
