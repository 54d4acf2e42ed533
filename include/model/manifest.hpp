#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace droidpack::model {

enum class ComponentKind {
    Activity,
    Service,
    Receiver,
    Provider,
};

const char *componentTag(ComponentKind kind);
// "activity", "service", ... Throws InvalidManifest for anything else.
ComponentKind parseComponentKind(const std::string &tag);

struct MetaData {
    std::string name;
    std::optional<std::string> value;
    std::optional<std::string> resource;
};

struct IntentFilter {
    std::vector<std::string> actions;
    std::vector<std::string> categories;
    // One map per <data> element, keyed by qualified attribute name.
    std::vector<std::map<std::string, std::string>> data;
};

struct Component {
    ComponentKind kind = ComponentKind::Activity;
    std::string name;
    // Qualified attribute name ("android:exported") to value, android:name excluded.
    std::map<std::string, std::string> attributes;
    std::vector<MetaData> metaData;
    std::vector<IntentFilter> intentFilters;
};

struct UsesFeature {
    std::optional<std::string> name;
    std::optional<int> glEsVersion;
    bool required = true;
};

struct ApplicationInfo {
    std::optional<std::string> label;
    std::optional<std::string> icon;
    std::optional<std::string> theme;
    std::optional<bool> debuggable;
    bool hasCode = false;
    std::optional<bool> extractNativeLibs;
    std::optional<bool> usesCleartextTraffic;
    std::vector<MetaData> metaData;
};

struct ManifestData {
    std::string package;
    std::optional<std::string> sharedUserId;
    int versionCode = 1;
    std::string versionName = "1.0";
    int minSdk = 0;
    int targetSdk = 0;
    std::optional<int> maxSdk;
    std::set<std::string> permissions;
    std::set<UsesFeature> features;
    ApplicationInfo application;
    std::vector<Component> components;
    // Raw XML emitted verbatim at the end of <manifest> and <application>, one line per entry.
    std::vector<std::string> extraXml;
    std::vector<std::string> applicationExtraXml;
};

bool operator==(const MetaData &a, const MetaData &b);
bool operator==(const IntentFilter &a, const IntentFilter &b);
bool operator==(const Component &a, const Component &b);
bool operator==(const UsesFeature &a, const UsesFeature &b);
bool operator<(const UsesFeature &a, const UsesFeature &b);
bool operator==(const ApplicationInfo &a, const ApplicationInfo &b);
bool operator==(const ManifestData &a, const ManifestData &b);

// An AndroidManifest that passed validation. There is no way to hold an
// invalid one: the constructor throws InvalidManifest or DuplicateComponent.
class Manifest {
public:
    explicit Manifest(ManifestData data);

    const ManifestData &data() const { return data_; }
    const std::string &package() const { return data_.package; }
    int minSdk() const { return data_.minSdk; }
    int targetSdk() const { return data_.targetSdk; }

private:
    ManifestData data_;
};

bool operator==(const Manifest &a, const Manifest &b);
bool operator!=(const Manifest &a, const Manifest &b);

struct ManifestOverrides {
    std::optional<std::string> package;
    std::optional<std::string> sharedUserId;
    std::optional<int> versionCode;
    std::optional<std::string> versionName;
    std::optional<int> minSdk;
    std::optional<int> targetSdk;
    std::optional<int> maxSdk;

    std::set<std::string> permissions;
    std::set<UsesFeature> features;

    std::optional<std::string> label;
    std::optional<std::string> icon;
    std::optional<std::string> theme;
    std::optional<bool> debuggable;
    std::optional<bool> hasCode;
    std::optional<bool> extractNativeLibs;
    std::optional<bool> usesCleartextTraffic;
    std::vector<MetaData> applicationMetaData;

    std::vector<Component> components;
    std::vector<std::string> extraXml;
    std::vector<std::string> applicationExtraXml;
};

bool isValidPackageName(const std::string &name);

// Lowest supported min SDK, newest known target SDK, no components.
Manifest defaultFor(const std::string &packageId);

// Scalars in overrides win, permission and feature sets are unioned, component
// lists are concatenated. A (tag, name) pair seen twice with different content
// throws DuplicateComponent; an identical repeat is kept once.
Manifest merge(const Manifest &base, const ManifestOverrides &overrides);

// Byte-stable AndroidManifest.xml text.
std::string toXml(const Manifest &manifest);

} // namespace droidpack::model
