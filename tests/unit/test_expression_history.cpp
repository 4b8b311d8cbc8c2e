#include <catch2/catch_test_macros.hpp>
#include <qdevkit/expression_history.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <random>

using qdevkit::ExpressionHistory;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test case ends
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("qdevkit_history_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    fs::path File(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST_CASE("History keeps most recent first", "[history]") {
    ExpressionHistory history;
    history.Add("$.a");
    history.Add("$.b");
    history.Add("$.c");

    REQUIRE(history.Size() == 3);
    REQUIRE(history.Items()[0] == "$.c");
    REQUIRE(history.Items()[2] == "$.a");

    SECTION("Re-adding moves an entry to the front without duplicating it") {
        history.Add("$.a");
        REQUIRE(history.Size() == 3);
        REQUIRE(history.Items()[0] == "$.a");
        REQUIRE(history.Items()[1] == "$.c");
        REQUIRE(history.Items()[2] == "$.b");
    }

    SECTION("Empty expressions are ignored") {
        history.Add("");
        history.Add("  \t ");
        REQUIRE(history.Size() == 3);
    }

    SECTION("Surrounding whitespace is trimmed before deduplication") {
        history.Add("  $.b\n");
        REQUIRE(history.Size() == 3);
        REQUIRE(history.Items()[0] == "$.b");
    }

    SECTION("Clear") {
        history.Clear();
        REQUIRE(history.Size() == 0);
    }
}

TEST_CASE("History evicts the oldest entry past capacity", "[history]") {
    ExpressionHistory history(3);
    for (const char* expr : { "$.1", "$.2", "$.3", "$.4" }) {
        history.Add(expr);
    }

    REQUIRE(history.Size() == 3);
    REQUIRE(history.Items()[0] == "$.4");
    REQUIRE(history.Items()[2] == "$.2");

    SECTION("Shrinking the capacity trims the tail") {
        history.SetCapacity(1);
        REQUIRE(history.Size() == 1);
        REQUIRE(history.Items()[0] == "$.4");
    }

    SECTION("Zero capacity falls back to the default") {
        ExpressionHistory fallback(0);
        REQUIRE(fallback.Capacity() == ExpressionHistory::kDefaultCapacity);
    }
}

TEST_CASE("History persistence", "[history]") {
    TempDir dir;

    SECTION("Save then load preserves order") {
        ExpressionHistory history;
        history.Add("$.first");
        history.Add("$..price");
        history.Add("$.store.book[?(@.price < 10)]");

        fs::path file = dir.File("nested/history.json");
        REQUIRE(history.Save(file.string()));
        REQUIRE(fs::exists(file));

        ExpressionHistory loaded;
        REQUIRE(loaded.Load(file.string()));
        REQUIRE(loaded.Items() == history.Items());
    }

    SECTION("Saved file carries a format version") {
        ExpressionHistory history;
        history.Add("$.x");
        fs::path file = dir.File("history.json");
        REQUIRE(history.Save(file.string()));

        std::ifstream in(file);
        nlohmann::json j = nlohmann::json::parse(in);
        REQUIRE(j["version"] == 1);
        REQUIRE(j["history"][0] == "$.x");
    }

    SECTION("Missing file is an empty history") {
        ExpressionHistory history;
        history.Add("$.stale");
        REQUIRE(history.Load(dir.File("absent.json").string()));
        REQUIRE(history.Size() == 0);
    }

    SECTION("Corrupt file yields an empty history and reports failure") {
        fs::path file = dir.File("corrupt.json");
        WriteFile(file, "{\"history\": [\"$.a\",");

        ExpressionHistory history;
        REQUIRE_FALSE(history.Load(file.string()));
        REQUIRE(history.Size() == 0);
    }

    SECTION("Unexpected layout is rejected") {
        fs::path file = dir.File("object.json");
        WriteFile(file, "{\"history\": \"$.a\"}");

        ExpressionHistory history;
        REQUIRE_FALSE(history.Load(file.string()));
        REQUIRE(history.Size() == 0);
    }

    SECTION("Bare array files are still read") {
        fs::path file = dir.File("legacy.json");
        WriteFile(file, "[\"$.a\", 42, \"\", \"$.b\", \"$.a\"]");

        ExpressionHistory history;
        REQUIRE(history.Load(file.string()));
        REQUIRE(history.Size() == 2);
        REQUIRE(history.Items()[0] == "$.a");
        REQUIRE(history.Items()[1] == "$.b");
    }

    SECTION("A write error at flush is reported") {
        if (!fs::exists("/dev/full")) {
            SKIP("No /dev/full on this platform");
        }
        ExpressionHistory history;
        history.Add("$.x");
        REQUIRE_FALSE(history.Save("/dev/full"));
    }

    SECTION("Load respects capacity") {
        fs::path file = dir.File("long.json");
        WriteFile(file, R"({"version":1,"history":["$.1","$.2","$.3","$.4"]})");

        ExpressionHistory history(2);
        REQUIRE(history.Load(file.string()));
        REQUIRE(history.Size() == 2);
        REQUIRE(history.Items()[1] == "$.2");
    }
}

TEST_CASE("Default history path lives in the home directory", "[history]") {
    std::string path = ExpressionHistory::DefaultPath();
    REQUIRE(fs::path(path).filename() == ".qdevkit_jsonpath_history.json");
}
