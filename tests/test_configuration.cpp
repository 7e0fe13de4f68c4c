#include <catch2/catch.hpp>
#include <httpconf/config/configuration.hpp>

#include <memory>

using namespace httpconf;
using namespace std::chrono_literals;

namespace {

class CaptureSink : public LogSink {
public:
    std::vector<std::string> messages;

    void write(const LogEntry& entry) override {
        messages.push_back(entry.message);
    }
};

} // anonymous namespace

TEST_CASE("Configuration lookup", "[configuration]") {
    auto config = Configuration::parse(R"({
        "http": {
            "context": "/app",
            "session": {"secure": true, "maxAge": "1 hour", "domain": null}
        },
        "http.parser.maxMemoryBuffer": "64k"
    })");
    REQUIRE(config);

    SECTION("nested and dotted keys are equivalent") {
        REQUIRE(*config->get<std::string>("http.context") == "/app");
        REQUIRE(config->get<MemorySize>("http.parser.maxMemoryBuffer")->to_bytes() == 65536);
    }

    SECTION("typed reads") {
        REQUIRE(*config->get<bool>("http.session.secure") == true);
        REQUIRE(*config->get<std::chrono::milliseconds>("http.session.maxAge") == 1h);
    }

    SECTION("missing key") {
        auto value = config->get<std::string>("http.flash.cookieName");
        REQUIRE(!value);
        REQUIRE(value.error().is(ConfigError::MissingKey));
        REQUIRE(value.error().key() == "http.flash.cookieName");
    }

    SECTION("optional reads treat null and absent alike") {
        auto domain = config->get<std::optional<std::string>>("http.session.domain");
        REQUIRE(domain);
        REQUIRE(!*domain);
        auto absent = config->get<std::optional<std::string>>("http.flash.domain");
        REQUIRE(absent);
        REQUIRE(!*absent);
        REQUIRE(!config->has("http.session.domain"));
        REQUIRE(config->find("http.session.domain") != nullptr);
    }

    SECTION("wrong type") {
        auto value = config->get<bool>("http.session");
        REQUIRE(!value);
        REQUIRE(value.error().is(ConfigError::BadValue));
        REQUIRE(std::string(value.error().message()).find("object") != std::string::npos);
    }
}

TEST_CASE("Configuration value conversions", "[configuration]") {
    auto config = Configuration::from_pairs({
        {"flag.yes", "yes"},
        {"flag.off", "off"},
        {"flag.bad", "maybe"},
        {"number.string", "42"},
        {"number.fraction", 1.5},
        {"text.number", 8080},
        {"duration.bare", 250},
        {"size.negative", -1},
    });

    REQUIRE(*config.get<bool>("flag.yes") == true);
    REQUIRE(*config.get<bool>("flag.off") == false);
    REQUIRE(config.get<bool>("flag.bad").error().is(ConfigError::BadValue));
    REQUIRE(*config.get<int64_t>("number.string") == 42);
    REQUIRE(!config.get<int64_t>("number.fraction"));
    REQUIRE(*config.get<double>("number.fraction") == 1.5);
    REQUIRE(*config.get<std::string>("text.number") == "8080");
    REQUIRE(*config.get<std::chrono::milliseconds>("duration.bare") == 250ms);
    REQUIRE(!config.get<MemorySize>("size.negative"));
}

TEST_CASE("Numbers too large for 64 bits", "[configuration]") {
    auto config = Configuration::from_pairs({
        {"size.huge", 1e30},
        {"size.limit", 9223372036854775808.0},
        {"number.huge", -1e30},
        {"duration.huge", 1e30},
        {"duration.limit", 9223372036855.0},
    });

    SECTION("memory size") {
        auto size = config.get<MemorySize>("size.huge");
        REQUIRE(!size);
        REQUIRE(size.error().is(ConfigError::BadValue));
        REQUIRE(size.error().key() == "size.huge");
        REQUIRE(std::string(size.error().message()).find("out of range") != std::string::npos);
        REQUIRE(!config.get<MemorySize>("size.limit"));
    }

    SECTION("integer") {
        REQUIRE(!config.get<int64_t>("size.limit"));
        auto value = config.get<int64_t>("number.huge");
        REQUIRE(!value);
        REQUIRE(value.error().is(ConfigError::BadValue));
    }

    SECTION("duration in milliseconds") {
        auto value = config.get<std::chrono::milliseconds>("duration.huge");
        REQUIRE(!value);
        REQUIRE(value.error().is(ConfigError::BadValue));
        REQUIRE(std::string(value.error().message()).find("out of range") != std::string::npos);
        REQUIRE(!config.get<std::chrono::milliseconds>("duration.limit"));
    }
}

TEST_CASE("Configuration layering", "[configuration]") {
    auto defaults = Configuration::from_pairs({
        {"http.context", "/"},
        {"http.session.cookieName", "APP_SESSION"},
        {"http.session.domain", "example.com"},
    });
    auto app = Configuration::from_pairs({
        {"http.context", "/app"},
        {"http.session.domain", nullptr},
    });
    auto config = app.with_fallback(defaults);

    REQUIRE(*config.get<std::string>("http.context") == "/app");
    REQUIRE(*config.get<std::string>("http.session.cookieName") == "APP_SESSION");

    SECTION("explicit null hides lower layers") {
        REQUIRE(!*config.get<std::optional<std::string>>("http.session.domain"));
    }

    SECTION("merged view") {
        JsonValue merged = config.merged();
        REQUIRE(merged.get("http")->get("context")->as_string() == "/app");
        REQUIRE(merged.get("http")->get("session")->get("cookieName")->as_string() == "APP_SESSION");
        REQUIRE(merged.get("http")->get("session")->get("domain")->is_null());
    }
}

TEST_CASE("Deprecated keys", "[configuration]") {
    auto sink = std::make_shared<CaptureSink>();
    Logger logger("test");
    logger.add_sink(sink);

    auto defaults = Configuration::from_pairs({{"http.context", "/"}});

    SECTION("legacy key set above the default wins and warns") {
        auto config = Configuration::from_pairs({{"application.context", "/legacy"}}).with_fallback(defaults);
        REQUIRE(*config.get_deprecated<std::string>("http.context", "application.context", logger) == "/legacy");
        REQUIRE(sink->messages.size() == 1);
        REQUIRE(sink->messages[0] == "application.context is deprecated, use http.context instead");
    }

    SECTION("new key wins when both are in the same layer") {
        auto config = Configuration::from_pairs({
            {"application.context", "/legacy"},
            {"http.context", "/new"},
        }).with_fallback(defaults);
        REQUIRE(*config.get_deprecated<std::string>("http.context", "application.context", logger) == "/new");
        REQUIRE(sink->messages.empty());
    }

    SECTION("only the new key") {
        REQUIRE(*defaults.get_deprecated<std::string>("http.context", "application.context", logger) == "/");
        REQUIRE(sink->messages.empty());
    }

    SECTION("legacy key below the new key is ignored") {
        auto config = Configuration::from_pairs({{"http.context", "/new"}})
            .with_fallback(Configuration::from_pairs({{"application.context", "/legacy"}}));
        REQUIRE(*config.get_deprecated<std::string>("http.context", "application.context", logger) == "/new");
    }
}

TEST_CASE("Configuration parse errors", "[configuration]") {
    SECTION("invalid JSON") {
        auto config = Configuration::parse("{\"http\": ", "application.json");
        REQUIRE(!config);
        REQUIRE(config.error().is(ConfigError::BadValue));
        REQUIRE(config.error().key() == "application.json");
    }

    SECTION("top level must be an object") {
        auto config = Configuration::parse("[1, 2]");
        REQUIRE(!config);
        REQUIRE(config.error().is(ConfigError::BadValue));
    }

    SECTION("missing file") {
        auto config = Configuration::load_file("/nonexistent/httpconf/application.json");
        REQUIRE(!config);
        REQUIRE(config.error().is(ConfigError::BadValue));
    }
}
