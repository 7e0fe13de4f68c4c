#include "httpconf/http/jwt.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace httpconf {

namespace {

constexpr std::array<SignatureAlgorithmInfo, 13> algorithms = {{
    {SignatureAlgorithm::None,  "none",  0},
    {SignatureAlgorithm::HS256, "HS256", 256},
    {SignatureAlgorithm::HS384, "HS384", 384},
    {SignatureAlgorithm::HS512, "HS512", 512},
    {SignatureAlgorithm::RS256, "RS256", 2048},
    {SignatureAlgorithm::RS384, "RS384", 2048},
    {SignatureAlgorithm::RS512, "RS512", 2048},
    {SignatureAlgorithm::ES256, "ES256", 256},
    {SignatureAlgorithm::ES384, "ES384", 384},
    {SignatureAlgorithm::ES512, "ES512", 521},
    {SignatureAlgorithm::PS256, "PS256", 2048},
    {SignatureAlgorithm::PS384, "PS384", 2048},
    {SignatureAlgorithm::PS512, "PS512", 2048},
}};

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

std::string join_key(std::string_view parent, std::string_view child) {
    std::string key(parent);
    key += '.';
    key += child;
    return key;
}

} // anonymous namespace

const SignatureAlgorithmInfo& signature_algorithm_info(SignatureAlgorithm alg) noexcept {
    return algorithms[static_cast<size_t>(alg)];
}

std::optional<SignatureAlgorithmInfo> find_signature_algorithm(std::string_view name) {
    for (const auto& info : algorithms) {
        if (iequals(info.name, name)) {
            return info;
        }
    }
    return std::nullopt;
}

expected<void, Error> check_secret_strength(const SignatureAlgorithmInfo& alg,
                                            std::string_view secret,
                                            std::string_view algorithm_key) {
    // std::string holds UTF-8 bytes, so size() is the encoded length
    int actual_bits = static_cast<int>(secret.size() * 8);
    if (actual_bits >= alg.min_key_length_bits) {
        return {};
    }

    std::string message =
        "The application secret is too short and does not have the recommended amount of entropy "
        "for algorithm " + std::string(alg.name) + " defined at " + std::string(algorithm_key) + ". "
        "Current application secret bits: " + std::to_string(actual_bits) +
        ", minimal required bits for algorithm " + std::string(alg.name) + ": " +
        std::to_string(alg.min_key_length_bits) + ".";

    return unexpected(Error::weak_secret("http.secret.key",
        WeakSecretInfo{std::string(alg.name), alg.min_key_length_bits, actual_bits},
        std::move(message)));
}

expected<JwtConfig, Error> parse_jwt_config(const Configuration& config,
                                            std::string_view secret,
                                            std::string_view parent) {
    JwtConfig jwt;

    std::string algorithm_key = join_key(parent, "signatureAlgorithm");
    auto algorithm = config.get<std::string>(algorithm_key);
    if (!algorithm) return unexpected(algorithm.error());

    auto info = find_signature_algorithm(*algorithm);
    if (!info) {
        return unexpected(Error(ConfigError::InvalidAlgorithm, algorithm_key,
            "Unsupported signature algorithm '" + *algorithm + "'"));
    }

    auto strength = check_secret_strength(*info, secret, algorithm_key);
    if (!strength) return unexpected(strength.error());
    jwt.signature_algorithm = *algorithm;

    auto expires_after = config.get<std::optional<std::chrono::milliseconds>>(join_key(parent, "expiresAfter"));
    if (!expires_after) return unexpected(expires_after.error());
    jwt.expires_after = *expires_after;

    auto clock_skew = config.get<std::chrono::milliseconds>(join_key(parent, "clockSkew"));
    if (!clock_skew) return unexpected(clock_skew.error());
    jwt.clock_skew = *clock_skew;

    auto data_claim = config.get<std::string>(join_key(parent, "dataClaim"));
    if (!data_claim) return unexpected(data_claim.error());
    jwt.data_claim = std::move(*data_claim);

    return jwt;
}

} // namespace httpconf
