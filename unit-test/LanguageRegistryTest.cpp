#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "sandbox/language.hpp"

using namespace std;
using namespace runbox;

TEST(LanguageRegistryTest, BuiltinLanguagesTest) {
    language_registry registry;
    EXPECT_EQ(registry.languages(), vector<string>({"cpp", "go", "java", "javascript", "python"}));

    auto &python = registry.resolve("python");
    EXPECT_EQ(python.filename, "code.py");
    EXPECT_EQ(python.image, "python:3.9-slim");
    EXPECT_EQ(python.command, vector<string>({"python", "{source}"}));

    EXPECT_EQ(registry.resolve("java").filename, "Main.java");
    EXPECT_EQ(registry.resolve("go").image, "golang:1.19-alpine");
}

TEST(LanguageRegistryTest, CaseInsensitiveTest) {
    language_registry registry;
    EXPECT_EQ(registry.resolve("Python").id, "python");
    EXPECT_EQ(registry.resolve("CPP").id, "cpp");
    EXPECT_TRUE(registry.supports("JavaScript"));
}

TEST(LanguageRegistryTest, UnsupportedLanguageTest) {
    language_registry registry;
    EXPECT_FALSE(registry.supports("cobol"));
    try {
        registry.resolve("cobol");
        FAIL() << "cobol should not be supported";
    } catch (unsupported_language &ex) {
        EXPECT_EQ(ex.language, "cobol");
        EXPECT_STREQ(ex.what(), "Unsupported language: cobol");
    }
}

TEST(LanguageRegistryTest, ExpandCommandTest) {
    language_registry registry;
    EXPECT_EQ(registry.resolve("python").expand_command("/app"),
              vector<string>({"python", "/app/code.py"}));
    EXPECT_EQ(registry.resolve("cpp").expand_command("/app"),
              vector<string>({"bash", "-c", "g++ -o /tmp/code.out /app/code.cpp && /tmp/code.out"}));

    language_profile profile{"ruby", "main.rb", "ruby:3", {"sh", "-c", "cd {workdir} && ruby {source}"}};
    EXPECT_EQ(profile.expand_command("/app"),
              vector<string>({"sh", "-c", "cd /app && ruby /app/main.rb"}));
}

TEST(LanguageRegistryTest, OverrideTest) {
    auto profiles = language_registry::builtin_profiles();
    profiles.push_back({"Python", "main.py", "python:3.11-slim", {"python3", "{source}"}});
    language_registry registry(profiles);

    EXPECT_EQ(registry.languages().size(), 5u);
    EXPECT_EQ(registry.resolve("python").image, "python:3.11-slim");
    EXPECT_EQ(registry.resolve("python").filename, "main.py");
}

static void make_registry(const string &id, const string &filename, const string &image, const vector<string> &command) {
    language_profile profile;
    profile.id = id;
    profile.filename = filename;
    profile.image = image;
    profile.command = command;
    language_registry registry(vector<language_profile>{profile});
}

TEST(LanguageRegistryTest, InvalidProfileTest) {
    EXPECT_NO_THROW(make_registry("x", "a.txt", "img", {"cat"}));
    EXPECT_THROW(make_registry("", "a.txt", "img", {"cat"}), invalid_argument);
    EXPECT_THROW(make_registry("x", "a.txt", "", {"cat"}), invalid_argument);
    EXPECT_THROW(make_registry("x", "a.txt", "img", {}), invalid_argument);
    EXPECT_THROW(make_registry("x", "../a.txt", "img", {"cat"}), invalid_argument);
    EXPECT_THROW(make_registry("x", "dir/a.txt", "img", {"cat"}), invalid_argument);
}

TEST(LanguageRegistryTest, JsonTest) {
    auto profile = nlohmann::json::parse(R"({"id": "ruby", "filename": "main.rb", "image": "ruby:3", "command": ["ruby", "{source}"]})")
                       .get<language_profile>();
    EXPECT_EQ(profile.id, "ruby");
    EXPECT_EQ(profile.command.size(), 2u);

    nlohmann::json j = profile;
    EXPECT_EQ(j.at("image"), "ruby:3");
}
