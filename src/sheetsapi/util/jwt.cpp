#include <memory>
#include <vector>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include "sheetsapi/exception.hpp"
#include "sheetsapi/util/encoding.hpp"
#include "sheetsapi/util/jwt.hpp"

namespace sheetsapi {

using BioHandle = std::unique_ptr<BIO, decltype(&BIO_free)>;
using KeyHandle = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using DigestHandle = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

static KeyHandle LoadPrivateKey(const std::string &pemKey) {
	// Keys pasted from JSON often keep their newlines escaped
	std::string pem = NormalizePemKey(pemKey);
	BioHandle bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
	if (!bio) {
		throw SheetsIOException("Failed to allocate a buffer for the private key");
	}
	KeyHandle key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
	if (!key) {
		throw SheetsIOException("Failed to parse private key");
	}
	return key;
}

static std::vector<unsigned char> SignSha256(EVP_PKEY *key, const std::string &input) {
	DigestHandle ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
	if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1) {
		throw SheetsIOException("Failed to initialize RS256 signing");
	}

	auto data = reinterpret_cast<const unsigned char *>(input.data());
	size_t length = 0;
	if (EVP_DigestSign(ctx.get(), nullptr, &length, data, input.size()) != 1) {
		throw SheetsIOException("Failed to size RS256 signature");
	}
	std::vector<unsigned char> signature(length);
	if (EVP_DigestSign(ctx.get(), signature.data(), &length, data, input.size()) != 1) {
		throw SheetsIOException("Failed to sign JWT");
	}
	signature.resize(length);
	return signature;
}

std::string SignJwtRs256(const nlohmann::json &claims, const std::string &pemKey) {
	static const nlohmann::json HEADER = {{"alg", "RS256"}, {"typ", "JWT"}};

	std::string signingInput = Base64UrlEncode(HEADER.dump()) + "." + Base64UrlEncode(claims.dump());
	KeyHandle key = LoadPrivateKey(pemKey);
	auto signature = SignSha256(key.get(), signingInput);
	return signingInput + "." + Base64UrlEncode(signature.data(), signature.size());
}

} // namespace sheetsapi
