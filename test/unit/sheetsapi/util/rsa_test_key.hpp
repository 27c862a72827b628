#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

// Throwaway RSA keys for signing tests, generated once per process.
namespace rsa_test_key {

using KeyHandle = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

inline EVP_PKEY *SharedKey() {
	static KeyHandle key(EVP_RSA_gen(2048), &EVP_PKEY_free);
	if (!key) {
		throw std::runtime_error("RSA key generation failed");
	}
	return key.get();
}

// PKCS#8 PEM of SharedKey(), the form Google puts in service account key files
inline std::string PrivateKeyPem() {
	std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
	if (!bio || PEM_write_bio_PrivateKey(bio.get(), SharedKey(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
		throw std::runtime_error("Failed to write RSA key as PEM");
	}
	char *data = nullptr;
	long length = BIO_get_mem_data(bio.get(), &data);
	return std::string(data, static_cast<size_t>(length));
}

inline std::string Base64UrlDecode(std::string text) {
	for (char &c : text) {
		if (c == '-') {
			c = '+';
		} else if (c == '_') {
			c = '/';
		}
	}
	size_t padding = (4 - text.size() % 4) % 4;
	text.append(padding, '=');

	std::vector<unsigned char> out(text.size() / 4 * 3);
	int length = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(text.data()),
	                             static_cast<int>(text.size()));
	if (length < 0) {
		throw std::runtime_error("Invalid base64url: " + text);
	}
	return std::string(reinterpret_cast<const char *>(out.data()), static_cast<size_t>(length) - padding);
}

// Checks an RS256 signature over `input` against SharedKey()
inline bool VerifyRs256(const std::string &input, const std::string &signature) {
	std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
	if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, SharedKey()) != 1) {
		return false;
	}
	return EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char *>(signature.data()), signature.size(),
	                        reinterpret_cast<const unsigned char *>(input.data()), input.size()) == 1;
}

// Splits a compact JWS into its three dot-separated parts
inline std::vector<std::string> SplitJwt(const std::string &jwt) {
	std::vector<std::string> parts;
	size_t start = 0;
	size_t dot;
	while ((dot = jwt.find('.', start)) != std::string::npos) {
		parts.push_back(jwt.substr(start, dot - start));
		start = dot + 1;
	}
	parts.push_back(jwt.substr(start));
	return parts;
}

} // namespace rsa_test_key
