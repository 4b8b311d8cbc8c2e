#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <qdevkit/json_path.h>

using qdevkit::JsonPath;
using qdevkit::JsonPathResult;
using qdevkit::ToolErrorKind;
using json = nlohmann::json;

namespace {

const char* kStore = R"({
  "store": {
    "name": "Corner Books",
    "book": [
      {"title": "Sayings", "author": "Rees", "price": 8.95, "tags": ["quotes"]},
      {"title": "Sword", "author": "Waugh", "price": 12.99},
      {"title": "Moby Dick", "author": "Melville", "price": 8.99, "isbn": "0-553-21311-3"},
      {"title": "The Lord", "author": "Tolkien", "price": 22.99, "isbn": "0-395-19395-8"}
    ],
    "bicycle": {"color": "red", "price": 19.95}
  }
})";

json Run(const std::string& expression, const std::string& text = kStore) {
    JsonPathResult result = JsonPath::Filter(text, expression);
    INFO(expression << " -> " << result.error_message);
    REQUIRE(result.success);
    return json::parse(result.output);
}

} // namespace

TEST_CASE("JSONPath member and index access", "[jsonpath]") {
    SECTION("Root returns the whole document") {
        json doc = Run("$");
        REQUIRE(doc == json::parse(kStore));
    }

    SECTION("Dot and bracket member names") {
        REQUIRE(Run("$.store.name") == "Corner Books");
        REQUIRE(Run("$['store']['bicycle'].color") == "red");
        REQUIRE(Run("$[\"store\"].name") == "Corner Books");
    }

    SECTION("Positive and negative indices") {
        REQUIRE(Run("$.store.book[0].title") == "Sayings");
        REQUIRE(Run("$.store.book[-1].title") == "The Lord");
    }

    SECTION("Out of range index matches nothing") {
        JsonPathResult result = JsonPath::Filter(kStore, "$.store.book[10]");
        REQUIRE(result.success);
        REQUIRE(result.match_count == 0);
        REQUIRE(result.output == "[]");
    }

    SECTION("Missing member matches nothing") {
        JsonPathResult result = JsonPath::Filter(kStore, "$.store.missing");
        REQUIRE(result.success);
        REQUIRE(result.match_count == 0);
        REQUIRE(result.output == "[]");
    }
}

TEST_CASE("JSONPath wildcards and unions", "[jsonpath]") {
    SECTION("Wildcard over an array") {
        json titles = Run("$.store.book[*].title");
        REQUIRE(titles == json::parse(R"(["Sayings","Sword","Moby Dick","The Lord"])"));
    }

    SECTION("Dot wildcard over an object keeps document order") {
        json members = Run("$.store.*");
        REQUIRE(members.size() == 3);
        REQUIRE(members[0] == "Corner Books");
        REQUIRE(members[2]["color"] == "red");
    }

    SECTION("Index union") {
        json authors = Run("$.store.book[0,2].author");
        REQUIRE(authors == json::parse(R"(["Rees","Melville"])"));
    }

    SECTION("Name union") {
        json fields = Run("$.store.bicycle['color','price']");
        REQUIRE(fields == json::parse(R"(["red",19.95])"));
    }
}

TEST_CASE("JSONPath slices", "[jsonpath]") {
    const std::string numbers = "[0,1,2,3,4,5]";

    REQUIRE(Run("$[1:3]", numbers) == json::parse("[1,2]"));
    REQUIRE(Run("$[:2]", numbers) == json::parse("[0,1]"));
    REQUIRE(Run("$[4:]", numbers) == json::parse("[4,5]"));
    REQUIRE(Run("$[-2:]", numbers) == json::parse("[4,5]"));
    REQUIRE(Run("$[::2]", numbers) == json::parse("[0,2,4]"));
    REQUIRE(Run("$[::-1]", numbers) == json::parse("[5,4,3,2,1,0]"));
    REQUIRE(Run("$[1:100]", numbers) == json::parse("[1,2,3,4,5]"));

    SECTION("Steps larger than the array stop after the first element") {
        JsonPathResult forward = JsonPath::Filter("[10,20,30]", "$[1::9223372036854775807]");
        REQUIRE(forward.success);
        REQUIRE(forward.match_count == 1);
        REQUIRE(json::parse(forward.output) == 20);

        JsonPathResult backward = JsonPath::Filter("[10,20,30]", "$[1::-9223372036854775808]");
        REQUIRE(backward.success);
        REQUIRE(backward.match_count == 1);
        REQUIRE(json::parse(backward.output) == 20);
    }

    SECTION("Single element slice still matches one node") {
        JsonPathResult result = JsonPath::Filter(numbers, "$[2:3]");
        REQUIRE(result.match_count == 1);
        REQUIRE(json::parse(result.output) == 2);
    }
}

TEST_CASE("JSONPath recursive descent", "[jsonpath]") {
    SECTION("All prices at any depth") {
        JsonPathResult result = JsonPath::Filter(kStore, "$..price");
        REQUIRE(result.success);
        REQUIRE(result.match_count == 5);
    }

    SECTION("Bracketed selectors after descent") {
        const char* users = R"({"users":[{"name":"a","email":"a@x.io","age":30},{"name":"b","email":"b@x.io"}]})";
        JsonPathResult result = JsonPath::Filter(users, "$..[name, email]");
        REQUIRE(result.success);
        REQUIRE(result.match_count == 4);
        REQUIRE(json::parse(result.output) == json::parse(R"(["a","a@x.io","b","b@x.io"])"));
    }
}

TEST_CASE("JSONPath filters", "[jsonpath]") {
    SECTION("Numeric comparison") {
        json cheap = Run("$.store.book[?(@.price < 10)].title");
        REQUIRE(cheap == json::parse(R"(["Sayings","Moby Dick"])"));
    }

    SECTION("Existence test") {
        json with_isbn = Run("$.store.book[?(@.isbn)].author");
        REQUIRE(with_isbn == json::parse(R"(["Melville","Tolkien"])"));
    }

    SECTION("String equality with either quote style") {
        REQUIRE(Run("$.store.book[?(@.author == 'Waugh')].title") == "Sword");
        REQUIRE(Run("$.store.book[?(@.author == \"Waugh\")].title") == "Sword");
    }

    SECTION("Inequality") {
        JsonPathResult result = JsonPath::Filter(kStore, "$.store.book[?(@.author != 'Waugh')]");
        REQUIRE(result.match_count == 3);
    }

    SECTION("Logical combinations") {
        json mid = Run("$.store.book[?(@.price > 8.96 && @.price <= 20)].title");
        REQUIRE(mid == json::parse(R"(["Sword","Moby Dick"])"));

        json ends = Run("$.store.book[?(@.title == 'Sayings' || @.price >= 22)].author");
        REQUIRE(ends == json::parse(R"(["Rees","Tolkien"])"));
    }

    SECTION("Nested filter path") {
        REQUIRE(Run("$.store.book[?(@.tags[0] == 'quotes')].title") == "Sayings");
    }

    SECTION("Ordering between mismatched types never matches") {
        JsonPathResult result = JsonPath::Filter(kStore, "$.store.book[?(@.title > 5)]");
        REQUIRE(result.success);
        REQUIRE(result.match_count == 0);
    }

    SECTION("Boolean and null literals") {
        const char* flags = R"([{"id":1,"on":true},{"id":2,"on":false},{"id":3,"on":null}])";
        REQUIRE(Run("$[?(@.on == true)].id", flags) == 1);
        REQUIRE(Run("$[?(@.on == null)].id", flags) == 3);
    }
}

TEST_CASE("JSONPath errors", "[jsonpath]") {
    SECTION("Expression must start at the root") {
        JsonPathResult result = JsonPath::Filter(kStore, "store.name");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::InvalidExpression);
        REQUIRE(result.error_message.find("position 0") != std::string::npos);
    }

    SECTION("Malformed brackets") {
        for (const char* expression : { "$.store[", "$.store['name'", "$[1,", "$[?(@.a == )]", "$[::0]", "$.", "$ store" }) {
            INFO(expression);
            JsonPathResult result = JsonPath::Filter(kStore, expression);
            REQUIRE_FALSE(result.success);
            REQUIRE(result.error == ToolErrorKind::InvalidExpression);
        }
    }

    SECTION("Filter without the current node") {
        std::string error;
        REQUIRE_FALSE(JsonPath::IsValidExpression("$[?(price > 1)]", error));
        REQUIRE(error.find("'@'") != std::string::npos);
    }

    SECTION("Invalid JSON input") {
        JsonPathResult result = JsonPath::Filter("{\"a\":", "$.a");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == ToolErrorKind::ParseError);
        REQUIRE(result.error_message.rfind("Invalid JSON", 0) == 0);
    }

    SECTION("Expression is checked before the document") {
        JsonPathResult result = JsonPath::Filter("not json", "nope");
        REQUIRE(result.error == ToolErrorKind::InvalidExpression);
    }
}

TEST_CASE("JSONPath result metadata", "[jsonpath]") {
    JsonPathResult result = JsonPath::Filter(kStore, "$.store.book[*].author");
    REQUIRE(result.success);
    REQUIRE(result.expression == "$.store.book[*].author");
    REQUIRE(result.match_count == 4);
    REQUIRE(result.output.find('\n') != std::string::npos);

    std::string error;
    REQUIRE(JsonPath::IsValidExpression("$..book[?(@.price >= 10)]", error));
    REQUIRE(error.empty());
}

TEST_CASE("JSONPath examples are valid expressions", "[jsonpath]") {
    auto examples = JsonPath::GetExamples();
    REQUIRE_FALSE(examples.empty());
    for (const auto& example : examples) {
        std::string error;
        INFO(example.first);
        REQUIRE(JsonPath::IsValidExpression(example.first, error));
        REQUIRE_FALSE(example.second.empty());
    }
}
