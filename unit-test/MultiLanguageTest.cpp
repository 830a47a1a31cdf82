#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/utils.hpp"
#include "sandbox/executor.hpp"

using namespace std;
using namespace runbox;
using ::testing::StartsWith;
namespace fs = std::filesystem;

/**
 * 在真实的容器运行时上执行各语言的程序。
 * 没有安装 docker，或者本地没有对应镜像时跳过测试（测试环境不一定能拉取镜像）。
 */
class MultiLanguageTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        exec = make_unique<executor>(executor_config());
    }

    static void TearDownTestCase() {
        exec.reset();
    }

    void SetUp() override {
        if (!exec->runtime_available())
            GTEST_SKIP() << "container runtime is not available";
    }

    bool image_available(const string &lang) {
        auto &profile = exec->languages().resolve(lang);
        return call_process(exec->config().runtime, "image", "inspect", profile.image) == 0;
    }

    execution_result run(const string &lang, const string &source, long timeout = 60) {
        execution_request request;
        request.code = source;
        request.language = lang;
        request.timeout = chrono::seconds(timeout);
        return exec->execute(request);
    }

    void test(const string &lang, const string &source) {
        if (!image_available(lang)) GTEST_SKIP() << "image for " << lang << " is not available";

        auto res = run(lang, source);
        ASSERT_TRUE(holds_alternative<result::success>(res)) << get_common(res).output;
        EXPECT_EQ(get_common(res).output, "hello world");
        EXPECT_TRUE(fs::is_empty(exec->config().workspace_root));
    }

    void test_timeout(const string &lang, const string &source) {
        if (!image_available(lang)) GTEST_SKIP() << "image for " << lang << " is not available";

        // 编译型语言的编译时间也计入时间限制，因此这里给一个较宽松的限制
        auto res = run(lang, source, 10);
        ASSERT_TRUE(holds_alternative<result::timeout>(res)) << get_common(res).output;
        EXPECT_EQ(get_common(res).output, "Execution timed out after 10 seconds");
        EXPECT_TRUE(fs::is_empty(exec->config().workspace_root));
        // 超时的容器已被删除，不会继续占用资源
        EXPECT_EQ(call_process("sh", "-c", "test -z \"$(" + exec->config().runtime.string() + " ps -aq --filter name=runbox-)\""), 0);
    }

    void test_failure(const string &lang, const string &source) {
        if (!image_available(lang)) GTEST_SKIP() << "image for " << lang << " is not available";

        auto res = run(lang, source);
        ASSERT_TRUE(holds_alternative<result::runtime_failure>(res)) << get_common(res).output;
        EXPECT_THAT(get_common(res).output, StartsWith("Error (Code "));
        EXPECT_TRUE(fs::is_empty(exec->config().workspace_root));
    }

    static unique_ptr<executor> exec;
};

unique_ptr<executor> MultiLanguageTest::exec;

TEST_F(MultiLanguageTest, PythonTest) {
    test("python", R"(print("hello world"))");
}

TEST_F(MultiLanguageTest, PythonTimeoutTest) {
    if (!image_available("python")) GTEST_SKIP();

    auto res = run("python", "while True: pass", 2);
    ASSERT_TRUE(holds_alternative<result::timeout>(res)) << get_common(res).output;
    EXPECT_EQ(get_common(res).output, "Execution timed out after 2 seconds");
    EXPECT_GE(get_common(res).elapsed, chrono::seconds(2));
    EXPECT_LT(get_common(res).elapsed, chrono::seconds(5));
}

TEST_F(MultiLanguageTest, PythonFailureTest) {
    test_failure("python", "raise ValueError('boom')");
}

TEST_F(MultiLanguageTest, PythonNetworkDisabledTest) {
    if (!image_available("python")) GTEST_SKIP();

    auto res = run("python", R"(
import socket
socket.create_connection(("1.1.1.1", 53), timeout=3)
print("connected"))");
    ASSERT_TRUE(holds_alternative<result::runtime_failure>(res)) << get_common(res).output;
}

TEST_F(MultiLanguageTest, PythonReadOnlyWorkspaceTest) {
    if (!image_available("python")) GTEST_SKIP();

    auto res = run("python", R"(open("/app/new.txt", "w").write("x"))");
    ASSERT_TRUE(holds_alternative<result::runtime_failure>(res)) << get_common(res).output;
}

TEST_F(MultiLanguageTest, JavaScriptTest) {
    test("javascript", R"(console.log("hello world"))");
}

TEST_F(MultiLanguageTest, JavaScriptTimeoutTest) {
    test_timeout("javascript", R"(while (true) {})");
}

TEST_F(MultiLanguageTest, CppTest) {
    test("cpp", R"(
#include <iostream>
int main() { std::cout << "hello world" << std::endl; })");
}

TEST_F(MultiLanguageTest, CppCompileErrorTest) {
    test_failure("cpp", R"(int main() { return })");
}

TEST_F(MultiLanguageTest, CppExitCodeTest) {
    if (!image_available("cpp")) GTEST_SKIP();

    auto res = run("cpp", "int main(){return 1;}");
    ASSERT_TRUE(holds_alternative<result::runtime_failure>(res)) << get_common(res).output;
    EXPECT_THAT(get_common(res).output, StartsWith("Error (Code 1):"));
}

TEST_F(MultiLanguageTest, CppTimeoutTest) {
    test_timeout("cpp", R"(int main() { while (true); })");
}

TEST_F(MultiLanguageTest, JavaTest) {
    test("java", R"(
public class Main {
    public static void main(String[] args) {
        System.out.println("hello world");
    }
})");
}

TEST_F(MultiLanguageTest, JavaCompileErrorTest) {
    test_failure("java", R"(public class Main { void f() { int x = "s"; } })");
}

TEST_F(MultiLanguageTest, JavaTimeoutTest) {
    test_timeout("java", R"(
public class Main {
    public static void main(String[] args) {
        while (true) {}
    }
})");
}

TEST_F(MultiLanguageTest, GoTest) {
    test("go", R"(package main
import "fmt"
func main() {
    fmt.Println("hello world")
})");
}

TEST_F(MultiLanguageTest, GoCompileErrorTest) {
    test_failure("go", R"(package main
func main() { undefined() })");
}

TEST_F(MultiLanguageTest, GoTimeoutTest) {
    test_timeout("go", R"(package main
func main() {
    for {}
})");
}
