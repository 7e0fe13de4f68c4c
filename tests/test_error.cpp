#include <catch2/catch.hpp>
#include <httpconf/core/error.hpp>

using namespace httpconf;

TEST_CASE("Error construction", "[error]") {
    SECTION("kind, key and message") {
        Error e(ConfigError::BadValue, "http.session.secure", "'maybe' is not a boolean");
        REQUIRE(e.is(ConfigError::BadValue));
        REQUIRE(!e.is(ConfigError::MissingKey));
        REQUIRE(e.kind() == ConfigError::BadValue);
        REQUIRE(e.key() == "http.session.secure");
        REQUIRE(e.message() == "'maybe' is not a boolean");
        REQUIRE(!e.weak_secret_info());
    }

    SECTION("std::error_code integration") {
        Error e(ConfigError::InvalidAlgorithm, "http.session.jwt.signatureAlgorithm");
        std::error_code ec = e.code();
        REQUIRE(ec.category().name() == std::string("httpconf.config"));
        REQUIRE(ec == ConfigError::InvalidAlgorithm);
        REQUIRE(ec.message() == "Unknown signature algorithm");
    }
}

TEST_CASE("Error factory methods", "[error]") {
    SECTION("invalid_path names the key") {
        Error e = Error::invalid_path("http.context");
        REQUIRE(e.is(ConfigError::InvalidPath));
        REQUIRE(e.key() == "http.context");
        REQUIRE(e.message() == "http.context must start with a /");
    }

    SECTION("missing_key") {
        Error e = Error::missing_key("http.parser.maxDiskBuffer");
        REQUIRE(e.is(ConfigError::MissingKey));
        REQUIRE(e.key() == "http.parser.maxDiskBuffer");
    }

    SECTION("forbidden_key") {
        Error e = Error::forbidden_key("mimetype", "mimetype replaced by http.fileMimeTypes map");
        REQUIRE(e.is(ConfigError::ForbiddenKey));
        REQUIRE(e.key() == "mimetype");
    }

    SECTION("weak_secret carries the bit counts") {
        Error e = Error::weak_secret("http.secret.key", WeakSecretInfo{"HS256", 256, 48}, "too short");
        REQUIRE(e.is(ConfigError::WeakSecret));
        REQUIRE(e.weak_secret_info());
        REQUIRE(e.weak_secret_info()->algorithm == "HS256");
        REQUIRE(e.weak_secret_info()->required_bits == 256);
        REQUIRE(e.weak_secret_info()->actual_bits == 48);
    }
}

TEST_CASE("Error to_string", "[error]") {
    SECTION("full form") {
        Error e = Error::invalid_path("http.session.path");
        REQUIRE(e.to_string() == "ConfigError::InvalidPath at http.session.path - http.session.path must start with a /");
    }

    SECTION("without message") {
        Error e(ConfigError::MissingSecret, "http.secret");
        REQUIRE(e.to_string() == "ConfigError::MissingSecret at http.secret");
    }

    SECTION("every kind has a name") {
        REQUIRE(config_error_name(ConfigError::InvalidPath) == "InvalidPath");
        REQUIRE(config_error_name(ConfigError::MissingSecret) == "MissingSecret");
        REQUIRE(config_error_name(ConfigError::WeakSecret) == "WeakSecret");
        REQUIRE(config_error_name(ConfigError::ForbiddenKey) == "ForbiddenKey");
        REQUIRE(config_error_name(ConfigError::InvalidAlgorithm) == "InvalidAlgorithm");
        REQUIRE(config_error_name(ConfigError::MissingKey) == "MissingKey");
        REQUIRE(config_error_name(ConfigError::BadValue) == "BadValue");
    }
}

TEST_CASE("Error equality and ConfigException", "[error]") {
    SECTION("equality compares kind and key") {
        REQUIRE(Error::invalid_path("http.context") == Error(ConfigError::InvalidPath, "http.context", "other"));
        REQUIRE(Error::invalid_path("http.context") != Error::invalid_path("http.flash.path"));
        REQUIRE(Error::missing_key("a") != Error::bad_value("a", "x"));
    }

    SECTION("exception wraps the error") {
        Error e = Error::missing_key("http.secret.key");
        try {
            throw ConfigException(e);
        } catch (const ConfigException& ex) {
            REQUIRE(ex.error() == e);
            REQUIRE(std::string(ex.what()) == e.to_string());
        }
    }
}
