#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "httpconf/config/configuration.hpp"
#include "httpconf/core/error.hpp"
#include "httpconf/util/expected.hpp"

namespace httpconf {

// ============================================================================
// Signature Algorithms
// ============================================================================

enum class SignatureAlgorithm {
    None,
    HS256, HS384, HS512,
    RS256, RS384, RS512,
    ES256, ES384, ES512,
    PS256, PS384, PS512
};

struct SignatureAlgorithmInfo {
    SignatureAlgorithm algorithm;
    std::string_view name;          // JWA name, e.g. "HS256"
    int min_key_length_bits;
};

const SignatureAlgorithmInfo& signature_algorithm_info(SignatureAlgorithm alg) noexcept;

// Case-insensitive lookup by JWA name
std::optional<SignatureAlgorithmInfo> find_signature_algorithm(std::string_view name);

// Fails with WeakSecret (key "http.secret.key") when the secret's UTF-8
// byte length in bits is below the algorithm's minimum.
// `algorithm_key` is the setting the algorithm was read from.
expected<void, Error> check_secret_strength(const SignatureAlgorithmInfo& alg,
                                            std::string_view secret,
                                            std::string_view algorithm_key);

// ============================================================================
// JWT Configuration
// ============================================================================

struct JwtConfig {
    // Signature algorithm used to sign the JWT
    std::string signature_algorithm = "HS256";

    // Period after which the JWT expires, if any
    std::optional<std::chrono::milliseconds> expires_after = std::nullopt;

    // Clock skew permitted for expiration / not-before checks
    std::chrono::milliseconds clock_skew = std::chrono::seconds(30);

    // Claim key holding the user data map
    std::string data_claim = "data";

    bool operator==(const JwtConfig&) const = default;
};

// Reads <parent>.signatureAlgorithm, .expiresAfter, .clockSkew, .dataClaim
// and validates the secret against the chosen algorithm.
expected<JwtConfig, Error> parse_jwt_config(const Configuration& config,
                                            std::string_view secret,
                                            std::string_view parent);

} // namespace httpconf
