#include "sdjwt/unpacker.hpp"
#include "common/constants.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"

namespace sdjwt {

namespace {
auto& log() { return Logger::get("sdjwt.unpacker"); }

// {"...": "<digest>"} and nothing else
const json::string* array_element_digest(const json::value& value) {
    const auto* obj = value.if_object();
    if (!obj || obj->size() != 1) return nullptr;
    auto it = obj->find(format::ARRAY_DIGEST_KEY);
    if (it == obj->end()) return nullptr;
    return it->value().if_string();
}

std::string_view view(const json::string& s) {
    return {s.data(), s.size()};
}
} // anonymous namespace

ClaimUnpacker::ClaimUnpacker(DigestIndex& index, VisitFn on_disclosure)
    : index_(index), on_disclosure_(std::move(on_disclosure)) {}

std::expected<json::object, ErrorCode> ClaimUnpacker::unpack(const json::object& payload) {
    auto result = unpack_object(payload, ClaimPath{}, nullptr);
    if (!result) {
        return std::unexpected(result.error());
    }
    result->erase(format::SD_ALG_KEY);
    return result;
}

std::expected<const Disclosure*, ErrorCode> ClaimUnpacker::consume(std::string_view digest) {
    const Disclosure* disclosure = index_.find(digest);
    if (!disclosure) {
        return nullptr;
    }
    if (!index_.mark_used(digest)) {
        log().warn("Digest {}... is referenced more than once", digest.substr(0, 8));
        return std::unexpected(ErrorCode::DUPLICATE_DIGEST);
    }
    return disclosure;
}

std::expected<json::value, ErrorCode> ClaimUnpacker::unpack_value(
    const json::value& value, const ClaimPath& path, const Disclosure* parent) {

    if (const auto* obj = value.if_object()) {
        auto result = unpack_object(*obj, path, parent);
        if (!result) return std::unexpected(result.error());
        return json::value(std::move(*result));
    }
    if (const auto* arr = value.if_array()) {
        auto result = unpack_array(*arr, path, parent);
        if (!result) return std::unexpected(result.error());
        return json::value(std::move(*result));
    }
    return value;
}

std::expected<json::object, ErrorCode> ClaimUnpacker::unpack_object(
    const json::object& obj, const ClaimPath& path, const Disclosure* parent) {

    json::object out;

    for (const auto& kv : obj) {
        if (kv.key() == format::SD_DIGESTS_KEY) continue;
        auto value = unpack_value(kv.value(), path.child(kv.key()), parent);
        if (!value) return std::unexpected(value.error());
        out[kv.key()] = std::move(*value);
    }

    auto sd = obj.find(format::SD_DIGESTS_KEY);
    if (sd == obj.end()) {
        return out;
    }
    if (!sd->value().is_array()) {
        log().warn("_sd at {} is not an array", path.to_string());
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }

    for (const auto& entry : sd->value().as_array()) {
        const auto* digest = entry.if_string();
        if (!digest) {
            log().warn("_sd at {} holds a non-string digest", path.to_string());
            return std::unexpected(ErrorCode::ENCODING_ERROR);
        }

        auto disclosure = consume(view(*digest));
        if (!disclosure) return std::unexpected(disclosure.error());
        if (!*disclosure) continue;  // withheld or decoy

        const Disclosure& d = **disclosure;
        if (d.is_array_element()) {
            log().warn("Array element disclosure referenced from _sd at {}", path.to_string());
            return std::unexpected(ErrorCode::ENCODING_ERROR);
        }
        if (out.contains(*d.key)) {
            log().warn("Disclosed claim {} collides with an existing claim", path.child(*d.key).to_string());
            return std::unexpected(ErrorCode::ENCODING_ERROR);
        }

        ClaimPath child = path.child(*d.key);
        if (on_disclosure_) {
            on_disclosure_(UnpackVisit{&d, child, parent});
        }

        auto value = unpack_value(d.value, child, &d);
        if (!value) return std::unexpected(value.error());
        out[*d.key] = std::move(*value);
    }

    return out;
}

std::expected<json::array, ErrorCode> ClaimUnpacker::unpack_array(
    const json::array& arr, const ClaimPath& path, const Disclosure* parent) {

    json::array out;

    for (const auto& element : arr) {
        const auto* digest = array_element_digest(element);
        if (!digest) {
            auto value = unpack_value(element, path.child(out.size()), parent);
            if (!value) return std::unexpected(value.error());
            out.push_back(std::move(*value));
            continue;
        }

        auto disclosure = consume(view(*digest));
        if (!disclosure) return std::unexpected(disclosure.error());
        if (!*disclosure) continue;  // withheld or decoy

        const Disclosure& d = **disclosure;
        if (!d.is_array_element()) {
            log().warn("Object claim disclosure referenced from array {}", path.to_string());
            return std::unexpected(ErrorCode::ENCODING_ERROR);
        }

        ClaimPath child = path.child(out.size());
        if (on_disclosure_) {
            on_disclosure_(UnpackVisit{&d, child, parent});
        }

        auto value = unpack_value(d.value, child, &d);
        if (!value) return std::unexpected(value.error());
        out.push_back(std::move(*value));
    }

    return out;
}

std::expected<std::string, ErrorCode> payload_digest_algorithm(const json::object& payload) {
    auto it = payload.find(format::SD_ALG_KEY);
    if (it == payload.end()) {
        return std::string(format::DEFAULT_DIGEST_ALG);
    }
    const auto* alg = it->value().if_string();
    if (!alg) {
        log().warn("_sd_alg is not a string");
        return std::unexpected(ErrorCode::ENCODING_ERROR);
    }
    std::string name(alg->data(), alg->size());
    if (!crypto::is_supported_digest(name)) {
        log().warn("Unsupported _sd_alg {}", name);
        return std::unexpected(ErrorCode::UNSUPPORTED_ALGORITHM);
    }
    return name;
}

const json::object* confirmation_key(const json::object& payload) {
    auto cnf = payload.find(format::CNF_KEY);
    if (cnf == payload.end() || !cnf->value().is_object()) return nullptr;
    const auto& obj = cnf->value().get_object();
    auto jwk = obj.find(format::JWK_KEY);
    if (jwk == obj.end()) return nullptr;
    return jwk->value().if_object();
}

} // namespace sdjwt
