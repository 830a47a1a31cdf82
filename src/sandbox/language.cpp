#include "sandbox/language.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

vector<string> language_profile::expand_command(const string &mount_path) const {
    string source = mount_path + "/" + filename;
    vector<string> result;
    for (auto &arg : command) {
        string expanded = boost::algorithm::replace_all_copy(arg, "{source}", source);
        boost::algorithm::replace_all(expanded, "{workdir}", mount_path);
        result.push_back(move(expanded));
    }
    return result;
}

void from_json(const json &j, language_profile &profile) {
    j.at("id").get_to(profile.id);
    j.at("filename").get_to(profile.filename);
    j.at("image").get_to(profile.image);
    j.at("command").get_to(profile.command);
}

void to_json(json &j, const language_profile &profile) {
    j = {{"id", profile.id},
         {"filename", profile.filename},
         {"image", profile.image},
         {"command", profile.command}};
}

language_registry::language_registry()
    : language_registry(builtin_profiles()) {}

language_registry::language_registry(const vector<language_profile> &list) {
    for (auto profile : list) {
        profile.id = boost::algorithm::to_lower_copy(profile.id);
        if (profile.id.empty())
            throw invalid_argument("Language id should not be empty");
        if (profile.image.empty())
            throw invalid_argument("Language " + profile.id + " has no container image");
        if (profile.command.empty())
            throw invalid_argument("Language " + profile.id + " has no command");
        assert_safe_path(profile.filename);
        profiles[profile.id] = move(profile);
    }
}

vector<language_profile> language_registry::builtin_profiles() {
    // 工作目录以只读方式挂载，因此编译产物都放在容器自己的 /tmp 中
    // clang-format off
    return {
        {"python", "code.py", "python:3.9-slim", {"python", "{source}"}},
        {"javascript", "code.js", "node:16-slim", {"node", "{source}"}},
        {"cpp", "code.cpp", "gcc:latest", {"bash", "-c", "g++ -o /tmp/code.out {source} && /tmp/code.out"}},
        {"java", "Main.java", "openjdk:11-jdk-slim", {"bash", "-c", "javac -d /tmp {source} && java -cp /tmp Main"}},
        // golang:alpine 镜像中没有 bash
        {"go", "main.go", "golang:1.19-alpine", {"sh", "-c", "go build -o /tmp/main {source} && /tmp/main"}}
    };
    // clang-format on
}

const language_profile &language_registry::resolve(const string &language) const {
    auto it = profiles.find(boost::algorithm::to_lower_copy(language));
    if (it == profiles.end())
        throw unsupported_language(language);
    return it->second;
}

bool language_registry::supports(const string &language) const {
    return profiles.count(boost::algorithm::to_lower_copy(language)) > 0;
}

vector<string> language_registry::languages() const {
    vector<string> result;
    for (auto &[id, profile] : profiles)
        result.push_back(id);
    return result;
}

}  // namespace runbox
