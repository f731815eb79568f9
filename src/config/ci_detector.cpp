#include <servherd/config/ci_detector.h>

#include <array>
#include <cstdlib>
#include <utility>

namespace servherd::config {

namespace {

constexpr std::array<std::pair<const char*, const char*>, 8> kProviders{{
    {"GitHub Actions", "GITHUB_ACTIONS"},
    {"GitLab CI", "GITLAB_CI"},
    {"CircleCI", "CIRCLECI"},
    {"Travis CI", "TRAVIS"},
    {"Jenkins", "JENKINS_URL"},
    {"Buildkite", "BUILDKITE"},
    {"Azure Pipelines", "AZURE_PIPELINES"},
    {"TeamCity", "TEAMCITY_VERSION"},
}};

bool envSet(const char* name) {
    const char* v = std::getenv(name);
    return v && *v;
}

} // namespace

bool CIDetector::isCI(const CIModeOptions& opts) {
    if (opts.noCi)
        return false;
    if (opts.ci)
        return true;
    if (envSet("CI"))
        return true;
    for (const auto& [name, var] : kProviders) {
        if (envSet(var))
            return true;
    }
    return false;
}

std::optional<std::string> CIDetector::ciName() {
    for (const auto& [name, var] : kProviders) {
        if (envSet(var))
            return std::string(name);
    }
    if (envSet("CI"))
        return std::string("Unknown CI");
    return std::nullopt;
}

CIInfo CIDetector::info() {
    return CIInfo{isCI(), ciName()};
}

} // namespace servherd::config
