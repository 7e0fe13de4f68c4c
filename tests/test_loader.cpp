#include <catch2/catch.hpp>
#include <httpconf/config/loader.hpp>
#include <httpconf/config/reference.hpp>
#include <httpconf/http/http_configuration.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace httpconf;

namespace {

struct TempApp {
    std::filesystem::path root;

    explicit TempApp(const std::string& name)
        : root(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "conf");
    }

    ~TempApp() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    void write(const std::filesystem::path& relative, const std::string& contents) const {
        std::ofstream f(root / relative);
        f << contents;
    }
};

LoadOptions without_env() {
    LoadOptions options;
    options.read_environment_variables = false;
    return options;
}

} // anonymous namespace

TEST_CASE("Override parsing", "[loader]") {
    auto pair = parse_override("http.context=/app");
    REQUIRE(pair);
    REQUIRE(pair->first == "http.context");
    REQUIRE(pair->second == "/app");

    auto with_equals = parse_override("http.secret.key=a=b");
    REQUIRE(with_equals);
    REQUIRE(with_equals->second == "a=b");

    REQUIRE(parse_override("http.context=")->second.empty());
    REQUIRE(!parse_override("=value"));
    REQUIRE(!parse_override("no-equals"));
}

TEST_CASE("Reference defaults", "[loader]") {
    const Configuration& reference = reference_configuration();
    REQUIRE(*reference.get<std::string>("http.context") == "/");
    REQUIRE(*reference.get<std::string>("http.session.cookieName") == "APP_SESSION");
    REQUIRE(*reference.get<std::string>("http.flash.cookieName") == "APP_FLASH");
    REQUIRE(*reference.get<std::string>("http.secret.key") == "changeme");
    REQUIRE(!reference.has("http.secret.provider"));
    REQUIRE(*reference.get<std::string>("http.fileMimeTypes") == std::string(default_file_mime_types()));
}

TEST_CASE("Configuration loading", "[loader]") {
    TempApp app("httpconf_loader_test");
    Environment env(app.root, Mode::Dev);

    SECTION("defaults only") {
        auto config = load_configuration(env, without_env());
        REQUIRE(config);
        REQUIRE(*config->get<std::string>("http.context") == "/");
    }

    SECTION("application.json overrides defaults") {
        app.write("conf/application.json", R"({"http": {"context": "/app"}, "http.session.secure": true})");
        auto config = load_configuration(env, without_env());
        REQUIRE(config);
        REQUIRE(*config->get<std::string>("http.context") == "/app");
        REQUIRE(*config->get<bool>("http.session.secure") == true);
        REQUIRE(*config->get<std::string>("http.session.cookieName") == "APP_SESSION");
    }

    SECTION("overrides win and are read as JSON when possible") {
        app.write("conf/application.json", R"({"http": {"context": "/app"}})");
        LoadOptions options = without_env();
        options.overrides = {
            {"http.context", "/override"},
            {"http.session.secure", "true"},
            {"http.session.domain", "null"},
            {"http.parser.maxDiskBuffer", "20m"},
        };
        auto config = load_configuration(env, options);
        REQUIRE(config);
        REQUIRE(*config->get<std::string>("http.context") == "/override");
        REQUIRE(config->find("http.session.secure")->is_bool());
        REQUIRE(config->find("http.session.domain")->is_null());
        REQUIRE(config->get<MemorySize>("http.parser.maxDiskBuffer")->to_bytes() == 20971520);
    }

    SECTION("digits-only secrets keep their text") {
        const std::string digits = "12345678901234567890123456789012";
        Environment prod(app.root, Mode::Prod);

        LoadOptions options = without_env();
        options.overrides = {{"http.secret.key", digits}};
        auto from_override = load_configuration(prod, options);
        REQUIRE(from_override);
        REQUIRE(from_override->find("http.secret.key")->is_number());
        auto http = resolve(*from_override, prod);
        REQUIRE(http);
        REQUIRE(http->secret.secret == digits);

        app.write("conf/application.json", R"({"http.secret.key": )" + digits + "}");
        auto from_file = load_configuration(prod, without_env());
        REQUIRE(from_file);
        REQUIRE(*from_file->get<std::string>("http.secret.key") == digits);
        auto resolved = resolve(*from_file, prod);
        REQUIRE(resolved);
        REQUIRE(resolved->secret.secret == digits);
    }

    SECTION("explicit config file") {
        app.write("custom.json", R"({"http.context": "/custom"})");
        LoadOptions options = without_env();
        options.config_file = app.root / "custom.json";
        auto config = load_configuration(env, options);
        REQUIRE(config);
        REQUIRE(*config->get<std::string>("http.context") == "/custom");
    }

    SECTION("unreadable config file") {
        LoadOptions options = without_env();
        options.config_file = app.root / "missing.json";
        auto config = load_configuration(env, options);
        REQUIRE(!config);
        REQUIRE(config.error().is(ConfigError::BadValue));
    }

    SECTION("malformed application.json") {
        app.write("conf/application.json", "{\"http\": ");
        auto config = load_configuration(env, without_env());
        REQUIRE(!config);
        REQUIRE(config.error().is(ConfigError::BadValue));
    }

    SECTION("APPLICATION_SECRET sits between overrides and the file") {
        app.write("conf/application.json", R"({"http.secret.key": "from-file"})");
        ::setenv("APPLICATION_SECRET", "from-environment", 1);

        auto from_env = load_configuration(env);
        REQUIRE(from_env);
        REQUIRE(*from_env->get<std::string>("http.secret.key") == "from-environment");

        LoadOptions options;
        options.overrides = {{"http.secret.key", "from-override"}};
        auto from_override = load_configuration(env, options);
        REQUIRE(from_override);
        REQUIRE(*from_override->get<std::string>("http.secret.key") == "from-override");

        ::unsetenv("APPLICATION_SECRET");
    }
}
