#include "model/manifest.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <tuple>
#include <utility>

#include "core/error.hpp"
#include "ndk/abi.hpp"

namespace droidpack::model
{
    namespace
    {

        constexpr const char *kAndroidNamespace = "http://schemas.android.com/apk/res/android";
        constexpr const char *kIndent = "    ";

        bool isIdentifierStart(char ch)
        {
            return std::isalpha(static_cast<unsigned char>(ch)) != 0;
        }

        bool isIdentifierChar(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
        }

        bool isValidAttributeName(const std::string &name)
        {
            if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) != 0 || name[0] == '_'))
            {
                return false;
            }
            return std::all_of(name.begin(), name.end(), [](char ch)
                               { return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == ':' || ch == '.' || ch == '-'; });
        }

        // ".MainActivity" and "MainActivity" both mean package + ".MainActivity".
        std::string qualifiedName(const std::string &package, const std::string &name)
        {
            if (!name.empty() && name[0] == '.')
            {
                return package + name;
            }
            if (name.find('.') == std::string::npos)
            {
                return package + "." + name;
            }
            return name;
        }

        std::string escapeXml(const std::string &value)
        {
            std::string out;
            out.reserve(value.size());
            for (char ch : value)
            {
                switch (ch)
                {
                case '&':
                    out += "&amp;";
                    break;
                case '<':
                    out += "&lt;";
                    break;
                case '>':
                    out += "&gt;";
                    break;
                case '"':
                    out += "&quot;";
                    break;
                case '\'':
                    out += "&apos;";
                    break;
                case '\n':
                    out += "&#10;";
                    break;
                case '\r':
                    out += "&#13;";
                    break;
                case '\t':
                    out += "&#9;";
                    break;
                default:
                    out.push_back(ch);
                    break;
                }
            }
            return out;
        }

        const char *boolText(bool value)
        {
            return value ? "true" : "false";
        }

        void validateMetaData(const std::vector<MetaData> &items, const std::string &where)
        {
            std::set<std::string> seen;
            for (const auto &item : items)
            {
                if (item.name.empty())
                {
                    throw InvalidManifest("meta-data without name in " + where);
                }
                if (item.value.has_value() == item.resource.has_value())
                {
                    throw InvalidManifest("meta-data " + item.name + " needs exactly one of value or resource");
                }
                if (!seen.insert(item.name).second)
                {
                    throw InvalidManifest("duplicate meta-data " + item.name + " in " + where);
                }
            }
        }

        void validateComponent(const Component &component)
        {
            const std::string tag = componentTag(component.kind);
            if (component.name.empty())
            {
                throw InvalidManifest("<" + tag + "> without android:name");
            }
            for (const auto &entry : component.attributes)
            {
                const std::string &key = entry.first;
                if (!isValidAttributeName(key))
                {
                    throw InvalidManifest("bad attribute name '" + key + "' on " + component.name);
                }
                if (key == "android:name")
                {
                    throw InvalidManifest("android:name given as attribute on " + component.name);
                }
            }
            validateMetaData(component.metaData, component.name);
            for (const auto &filter : component.intentFilters)
            {
                if (filter.actions.empty())
                {
                    throw InvalidManifest("intent-filter without action on " + component.name);
                }
                for (const auto &data : filter.data)
                {
                    for (const auto &entry : data)
                    {
                        if (!isValidAttributeName(entry.first))
                        {
                            throw InvalidManifest("bad <data> attribute '" + entry.first + "' on " + component.name);
                        }
                    }
                }
            }
        }

        // One fragment renders as one line, so two fragments never print like one.
        void validateFragments(const std::vector<std::string> &fragments, const std::string &where)
        {
            for (const auto &fragment : fragments)
            {
                if (fragment.find_first_of("\r\n") != std::string::npos)
                {
                    throw InvalidManifest("extra XML in " + where + " spans several lines: split it into one entry per line");
                }
            }
        }

        void validate(const ManifestData &data)
        {
            if (data.package.empty())
            {
                throw InvalidManifest("package name is empty");
            }
            if (!isValidPackageName(data.package))
            {
                throw InvalidManifest("package name '" + data.package + "' is not a valid identifier");
            }
            if (data.sharedUserId.has_value() && !isValidPackageName(data.sharedUserId.value()))
            {
                throw InvalidManifest("sharedUserId '" + data.sharedUserId.value() + "' is not a valid identifier");
            }
            if (data.versionCode < 0)
            {
                throw InvalidManifest("versionCode must not be negative");
            }
            if (data.minSdk < 1)
            {
                throw InvalidManifest("minSdkVersion must be at least 1");
            }
            if (data.minSdk > data.targetSdk)
            {
                throw InvalidManifest("min_api > target_api (" + std::to_string(data.minSdk) + " > " +
                                      std::to_string(data.targetSdk) + ")");
            }
            if (data.maxSdk.has_value() && data.maxSdk.value() < data.targetSdk)
            {
                throw InvalidManifest("maxSdkVersion is below targetSdkVersion");
            }
            for (const auto &permission : data.permissions)
            {
                if (permission.empty())
                {
                    throw InvalidManifest("empty permission name");
                }
            }
            for (const auto &feature : data.features)
            {
                if (!feature.name.has_value() && !feature.glEsVersion.has_value())
                {
                    throw InvalidManifest("uses-feature needs a name or glEsVersion");
                }
            }
            validateMetaData(data.application.metaData, "application");
            validateFragments(data.extraXml, "<manifest>");
            validateFragments(data.applicationExtraXml, "<application>");

            std::set<std::pair<std::string, std::string>> seen;
            for (const auto &component : data.components)
            {
                validateComponent(component);
                const std::string tag = componentTag(component.kind);
                if (!seen.emplace(tag, qualifiedName(data.package, component.name)).second)
                {
                    throw DuplicateComponent(tag, component.name);
                }
            }
        }

        void appendComponent(std::vector<Component> &list, const Component &candidate, const std::string &package)
        {
            const std::string key = qualifiedName(package, candidate.name);
            for (const auto &existing : list)
            {
                if (existing.kind != candidate.kind || qualifiedName(package, existing.name) != key)
                {
                    continue;
                }
                if (existing == candidate)
                {
                    return;
                }
                throw DuplicateComponent(componentTag(candidate.kind), candidate.name);
            }
            list.push_back(candidate);
        }

        void appendUnique(std::vector<std::string> &list, const std::string &value)
        {
            if (std::find(list.begin(), list.end(), value) == list.end())
            {
                list.push_back(value);
            }
        }

        void writeMetaData(std::ostringstream &out, const std::vector<MetaData> &items, int depth)
        {
            for (const auto &item : items)
            {
                for (int i = 0; i < depth; ++i)
                {
                    out << kIndent;
                }
                out << "<meta-data android:name=\"" << escapeXml(item.name) << "\"";
                if (item.resource.has_value())
                {
                    out << " android:resource=\"" << escapeXml(item.resource.value()) << "\"";
                }
                if (item.value.has_value())
                {
                    out << " android:value=\"" << escapeXml(item.value.value()) << "\"";
                }
                out << " />\n";
            }
        }

        void writeFragments(std::ostringstream &out, const std::vector<std::string> &fragments, int depth)
        {
            for (const auto &fragment : fragments)
            {
                for (int i = 0; i < depth; ++i)
                {
                    out << kIndent;
                }
                out << fragment << "\n";
            }
        }

        void writeComponent(std::ostringstream &out, const Component &component)
        {
            const std::string tag = componentTag(component.kind);
            const std::string pad = std::string(kIndent) + kIndent;
            out << pad << "<" << tag << " android:name=\"" << escapeXml(component.name) << "\"";
            for (const auto &[key, value] : component.attributes)
            {
                out << "\n"
                    << pad << kIndent << kIndent << key << "=\"" << escapeXml(value) << "\"";
            }

            if (component.metaData.empty() && component.intentFilters.empty())
            {
                out << " />\n";
                return;
            }
            out << ">\n";

            writeMetaData(out, component.metaData, 3);
            for (const auto &filter : component.intentFilters)
            {
                out << pad << kIndent << "<intent-filter>\n";
                for (const auto &action : filter.actions)
                {
                    out << pad << kIndent << kIndent << "<action android:name=\"" << escapeXml(action) << "\" />\n";
                }
                for (const auto &category : filter.categories)
                {
                    out << pad << kIndent << kIndent << "<category android:name=\"" << escapeXml(category) << "\" />\n";
                }
                for (const auto &data : filter.data)
                {
                    out << pad << kIndent << kIndent << "<data";
                    for (const auto &[key, value] : data)
                    {
                        out << " " << key << "=\"" << escapeXml(value) << "\"";
                    }
                    out << " />\n";
                }
                out << pad << kIndent << "</intent-filter>\n";
            }
            out << pad << "</" << tag << ">\n";
        }

    } // namespace

    const char *componentTag(ComponentKind kind)
    {
        switch (kind)
        {
        case ComponentKind::Activity:
            return "activity";
        case ComponentKind::Service:
            return "service";
        case ComponentKind::Receiver:
            return "receiver";
        case ComponentKind::Provider:
            return "provider";
        }
        return "activity";
    }

    ComponentKind parseComponentKind(const std::string &tag)
    {
        if (tag == "activity")
        {
            return ComponentKind::Activity;
        }
        if (tag == "service")
        {
            return ComponentKind::Service;
        }
        if (tag == "receiver")
        {
            return ComponentKind::Receiver;
        }
        if (tag == "provider")
        {
            return ComponentKind::Provider;
        }
        throw InvalidManifest("unknown component kind '" + tag + "'");
    }

    bool operator==(const MetaData &a, const MetaData &b)
    {
        return a.name == b.name && a.value == b.value && a.resource == b.resource;
    }

    bool operator==(const IntentFilter &a, const IntentFilter &b)
    {
        return a.actions == b.actions && a.categories == b.categories && a.data == b.data;
    }

    bool operator==(const Component &a, const Component &b)
    {
        return a.kind == b.kind && a.name == b.name && a.attributes == b.attributes && a.metaData == b.metaData &&
               a.intentFilters == b.intentFilters;
    }

    bool operator==(const UsesFeature &a, const UsesFeature &b)
    {
        return a.name == b.name && a.glEsVersion == b.glEsVersion && a.required == b.required;
    }

    bool operator<(const UsesFeature &a, const UsesFeature &b)
    {
        return std::tie(a.name, a.glEsVersion, a.required) < std::tie(b.name, b.glEsVersion, b.required);
    }

    bool operator==(const ApplicationInfo &a, const ApplicationInfo &b)
    {
        return a.label == b.label && a.icon == b.icon && a.theme == b.theme && a.debuggable == b.debuggable &&
               a.hasCode == b.hasCode && a.extractNativeLibs == b.extractNativeLibs &&
               a.usesCleartextTraffic == b.usesCleartextTraffic && a.metaData == b.metaData;
    }

    bool operator==(const ManifestData &a, const ManifestData &b)
    {
        return a.package == b.package && a.sharedUserId == b.sharedUserId && a.versionCode == b.versionCode &&
               a.versionName == b.versionName && a.minSdk == b.minSdk && a.targetSdk == b.targetSdk &&
               a.maxSdk == b.maxSdk && a.permissions == b.permissions && a.features == b.features &&
               a.application == b.application && a.components == b.components && a.extraXml == b.extraXml &&
               a.applicationExtraXml == b.applicationExtraXml;
    }

    Manifest::Manifest(ManifestData data)
        : data_(std::move(data))
    {
        validate(data_);
    }

    bool operator==(const Manifest &a, const Manifest &b)
    {
        return a.data() == b.data();
    }

    bool operator!=(const Manifest &a, const Manifest &b)
    {
        return !(a == b);
    }

    bool isValidPackageName(const std::string &name)
    {
        std::size_t segments = 0;
        std::size_t start = 0;
        while (start <= name.size())
        {
            const std::size_t dot = name.find('.', start);
            const std::size_t end = dot == std::string::npos ? name.size() : dot;
            if (end == start || !isIdentifierStart(name[start]))
            {
                return false;
            }
            for (std::size_t i = start; i < end; ++i)
            {
                if (!isIdentifierChar(name[i]))
                {
                    return false;
                }
            }
            ++segments;
            if (dot == std::string::npos)
            {
                break;
            }
            start = dot + 1;
        }
        return segments >= 2;
    }

    Manifest defaultFor(const std::string &packageId)
    {
        ManifestData data;
        data.package = packageId;
        data.versionCode = 1;
        data.versionName = "1.0";
        data.minSdk = ndk::defaultMinApi();
        data.targetSdk = ndk::maxKnownApi();
        data.application.hasCode = false;
        data.application.debuggable = false;
        return Manifest(std::move(data));
    }

    Manifest merge(const Manifest &base, const ManifestOverrides &overrides)
    {
        ManifestData out = base.data();

        if (overrides.package.has_value())
        {
            out.package = overrides.package.value();
        }
        if (overrides.sharedUserId.has_value())
        {
            out.sharedUserId = overrides.sharedUserId;
        }
        if (overrides.versionCode.has_value())
        {
            out.versionCode = overrides.versionCode.value();
        }
        if (overrides.versionName.has_value())
        {
            out.versionName = overrides.versionName.value();
        }
        if (overrides.minSdk.has_value())
        {
            out.minSdk = overrides.minSdk.value();
        }
        if (overrides.targetSdk.has_value())
        {
            out.targetSdk = overrides.targetSdk.value();
        }
        if (overrides.maxSdk.has_value())
        {
            out.maxSdk = overrides.maxSdk;
        }

        out.permissions.insert(overrides.permissions.begin(), overrides.permissions.end());
        out.features.insert(overrides.features.begin(), overrides.features.end());

        ApplicationInfo &app = out.application;
        if (overrides.label.has_value())
        {
            app.label = overrides.label;
        }
        if (overrides.icon.has_value())
        {
            app.icon = overrides.icon;
        }
        if (overrides.theme.has_value())
        {
            app.theme = overrides.theme;
        }
        if (overrides.debuggable.has_value())
        {
            app.debuggable = overrides.debuggable;
        }
        if (overrides.hasCode.has_value())
        {
            app.hasCode = overrides.hasCode.value();
        }
        if (overrides.extractNativeLibs.has_value())
        {
            app.extractNativeLibs = overrides.extractNativeLibs;
        }
        if (overrides.usesCleartextTraffic.has_value())
        {
            app.usesCleartextTraffic = overrides.usesCleartextTraffic;
        }
        for (const auto &item : overrides.applicationMetaData)
        {
            auto it = std::find_if(app.metaData.begin(), app.metaData.end(), [&](const MetaData &existing)
                                   { return existing.name == item.name; });
            if (it == app.metaData.end())
            {
                app.metaData.push_back(item);
            }
            else
            {
                *it = item;
            }
        }

        std::vector<Component> components = base.data().components;
        for (const auto &component : overrides.components)
        {
            appendComponent(components, component, out.package);
        }
        out.components = std::move(components);

        for (const auto &fragment : overrides.extraXml)
        {
            appendUnique(out.extraXml, fragment);
        }
        for (const auto &fragment : overrides.applicationExtraXml)
        {
            appendUnique(out.applicationExtraXml, fragment);
        }

        return Manifest(std::move(out));
    }

    std::string toXml(const Manifest &manifest)
    {
        const ManifestData &data = manifest.data();
        std::ostringstream out;

        out << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
        out << "<manifest xmlns:android=\"" << kAndroidNamespace << "\"\n";
        out << kIndent << kIndent << "package=\"" << escapeXml(data.package) << "\"\n";
        if (data.sharedUserId.has_value())
        {
            out << kIndent << kIndent << "android:sharedUserId=\"" << escapeXml(data.sharedUserId.value()) << "\"\n";
        }
        out << kIndent << kIndent << "android:versionCode=\"" << data.versionCode << "\"\n";
        out << kIndent << kIndent << "android:versionName=\"" << escapeXml(data.versionName) << "\">\n";

        out << kIndent << "<uses-sdk android:minSdkVersion=\"" << data.minSdk << "\" android:targetSdkVersion=\""
            << data.targetSdk << "\"";
        if (data.maxSdk.has_value())
        {
            out << " android:maxSdkVersion=\"" << data.maxSdk.value() << "\"";
        }
        out << " />\n";

        for (const auto &permission : data.permissions)
        {
            out << kIndent << "<uses-permission android:name=\"" << escapeXml(permission) << "\" />\n";
        }
        for (const auto &feature : data.features)
        {
            out << kIndent << "<uses-feature";
            if (feature.name.has_value())
            {
                out << " android:name=\"" << escapeXml(feature.name.value()) << "\"";
            }
            if (feature.glEsVersion.has_value())
            {
                std::ostringstream hex;
                hex << "0x" << std::hex << std::setfill('0') << std::setw(8) << feature.glEsVersion.value();
                out << " android:glEsVersion=\"" << hex.str() << "\"";
            }
            out << " android:required=\"" << boolText(feature.required) << "\" />\n";
        }

        const ApplicationInfo &app = data.application;
        out << kIndent << "<application android:hasCode=\"" << boolText(app.hasCode) << "\"";
        if (app.label.has_value())
        {
            out << "\n"
                << kIndent << kIndent << kIndent << "android:label=\"" << escapeXml(app.label.value()) << "\"";
        }
        if (app.icon.has_value())
        {
            out << "\n"
                << kIndent << kIndent << kIndent << "android:icon=\"" << escapeXml(app.icon.value()) << "\"";
        }
        if (app.theme.has_value())
        {
            out << "\n"
                << kIndent << kIndent << kIndent << "android:theme=\"" << escapeXml(app.theme.value()) << "\"";
        }
        if (app.debuggable.has_value())
        {
            out << "\n"
                << kIndent << kIndent << kIndent << "android:debuggable=\"" << boolText(app.debuggable.value()) << "\"";
        }
        if (app.extractNativeLibs.has_value())
        {
            out << "\n"
                << kIndent << kIndent << kIndent << "android:extractNativeLibs=\"" << boolText(app.extractNativeLibs.value()) << "\"";
        }
        if (app.usesCleartextTraffic.has_value())
        {
            out << "\n"
                << kIndent << kIndent << kIndent << "android:usesCleartextTraffic=\"" << boolText(app.usesCleartextTraffic.value()) << "\"";
        }
        out << ">\n";

        writeMetaData(out, app.metaData, 2);
        for (const auto &component : data.components)
        {
            writeComponent(out, component);
        }
        writeFragments(out, data.applicationExtraXml, 2);
        out << kIndent << "</application>\n";

        writeFragments(out, data.extraXml, 1);
        out << "</manifest>\n";
        return out.str();
    }

} // namespace droidpack::model
