#include "sheetsapi/util/encoding.hpp"

#include <cctype>
#include <vector>

#include <openssl/evp.h>

namespace sheetsapi {

static const char HEX_DIGITS[] = "0123456789ABCDEF";

std::string Base64UrlEncode(const unsigned char *data, size_t len) {
	if (len == 0) {
		return "";
	}
	// EVP_EncodeBlock writes padded standard Base64 plus a terminating NUL
	std::vector<unsigned char> block(4 * ((len + 2) / 3) + 1);
	int written = EVP_EncodeBlock(block.data(), data, static_cast<int>(len));

	std::string result(reinterpret_cast<const char *>(block.data()), static_cast<size_t>(written));
	while (!result.empty() && result.back() == '=') {
		result.pop_back();
	}
	for (char &c : result) {
		if (c == '+') {
			c = '-';
		} else if (c == '/') {
			c = '_';
		}
	}
	return result;
}

std::string Base64UrlEncode(const std::string &input) {
	return Base64UrlEncode(reinterpret_cast<const unsigned char *>(input.c_str()), input.length());
}

std::string NormalizePemKey(const std::string &key) {
	std::string pem = key;
	size_t pos = 0;
	while ((pos = pem.find("\\n", pos)) != std::string::npos) {
		pem.replace(pos, 2, "\n");
		pos += 1;
	}
	return pem;
}

std::string UrlEncode(const std::string &str) {
	std::string encoded;
	for (char c : str) {
		unsigned char byte = static_cast<unsigned char>(c);
		if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~') {
			encoded += c;
		} else {
			encoded += '%';
			encoded += HEX_DIGITS[byte >> 4];
			encoded += HEX_DIGITS[byte & 0x0F];
		}
	}
	return encoded;
}

} // namespace sheetsapi
