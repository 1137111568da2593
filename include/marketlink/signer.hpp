#pragma once

#include "marketlink/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace marketlink {

/// Authentication headers returned by the signer
struct AuthHeaders {
	std::string access_key;
	std::string signature; // base64
	std::string timestamp;
};

/// Build the canonical signing string: {timestamp}{METHOD}{path}
///
/// The method is uppercased and anything from the first '?' in the path on is
/// dropped, so query parameters never take part in the signature.
[[nodiscard]] std::string canonical_message(std::int64_t timestamp_ms, std::string_view method,
											std::string_view path);

/// RSA-PSS signer for exchange request authentication
///
/// - Message format: {timestamp}{method}{path}
/// - Algorithm: RSA-PSS with SHA-256, MGF1(SHA-256)
/// - Salt length: same as digest (32 bytes)
///
/// The signer holds no mutable state after construction and may be shared
/// between threads.
class Signer {
public:
	/// Create a signer from a PEM-encoded RSA private key (PKCS#1 or PKCS#8)
	[[nodiscard]] static Result<Signer> from_pem(std::string_view key_id, std::string_view pem_key);

	~Signer();
	Signer(Signer&&) noexcept;
	Signer& operator=(Signer&&) noexcept;

	// Non-copyable due to OpenSSL key ownership
	Signer(const Signer&) = delete;
	Signer& operator=(const Signer&) = delete;

	/// Raw signature bytes over the canonical message
	[[nodiscard]] Result<std::vector<unsigned char>>
	sign(std::int64_t timestamp_ms, std::string_view method, std::string_view path) const;

	/// Header triple for a request signed at timestamp_ms
	[[nodiscard]] Result<AuthHeaders> sign_headers(std::int64_t timestamp_ms,
												   std::string_view method,
												   std::string_view path) const;

	/// Check a raw signature against the public half of the key
	[[nodiscard]] Result<bool> verify(std::int64_t timestamp_ms, std::string_view method,
									  std::string_view path,
									  const std::vector<unsigned char>& signature) const;

	[[nodiscard]] std::string_view key_id() const noexcept;

private:
	struct Impl;
	std::unique_ptr<Impl> impl_;

	explicit Signer(std::unique_ptr<Impl> impl);
};

/// Base64 without line breaks, as used by the signature header
[[nodiscard]] std::string base64_encode(const unsigned char* data, std::size_t len);

} // namespace marketlink
