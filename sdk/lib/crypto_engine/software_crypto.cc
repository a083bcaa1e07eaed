// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/config.hh>
#include <appcheck/software_crypto.hh>
#include <array>
#include <debug.hh>
#include <errno.h>
#include <memory>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugCryptoEngine, "Crypto engine">;

	/// The RSA public exponent used by signed binaries.
	constexpr unsigned long RsaExponent = 65537;

	template<typename T, void (*Free)(T *)>
	struct OpenSSLDeleter
	{
		void operator()(T *pointer) const
		{
			Free(pointer);
		}
	};

	using BigNum = std::unique_ptr<BIGNUM, OpenSSLDeleter<BIGNUM, BN_free>>;
	using ParamBuilder =
	  std::unique_ptr<OSSL_PARAM_BLD,
	                  OpenSSLDeleter<OSSL_PARAM_BLD, OSSL_PARAM_BLD_free>>;
	using Params =
	  std::unique_ptr<OSSL_PARAM, OpenSSLDeleter<OSSL_PARAM, OSSL_PARAM_free>>;
	using PkeyContext =
	  std::unique_ptr<EVP_PKEY_CTX,
	                  OpenSSLDeleter<EVP_PKEY_CTX, EVP_PKEY_CTX_free>>;
	using Pkey =
	  std::unique_ptr<EVP_PKEY, OpenSSLDeleter<EVP_PKEY, EVP_PKEY_free>>;
	using MdContext =
	  std::unique_ptr<EVP_MD_CTX, OpenSSLDeleter<EVP_MD_CTX, EVP_MD_CTX_free>>;

	/**
	 * Returns the OpenSSL digest for a credentials format, or null if the
	 * format is not a digest.
	 */
	const EVP_MD *digest_for(CredentialsFormat format)
	{
		switch (format)
		{
			case CredentialsFormat::SHA256:
				return EVP_sha256();
			case CredentialsFormat::SHA384:
				return EVP_sha384();
			case CredentialsFormat::SHA512:
				return EVP_sha512();
			default:
				return nullptr;
		}
	}

	/**
	 * Log and clear the OpenSSL error queue.
	 */
	void report_openssl_error(const char *operation)
	{
		unsigned long error = ERR_get_error();
		std::array<char, 256> buffer{};
		ERR_error_string_n(error, buffer.data(), buffer.size());
		const char *message = buffer.data();
		Debug::log<DebugLevel::Error>("{} failed: {}", operation, message);
		ERR_clear_error();
	}

	/**
	 * Build an RSA public key from a big-endian modulus.
	 */
	Pkey rsa_public_key(std::span<const uint8_t> modulus)
	{
		BigNum n{BN_bin2bn(
		  modulus.data(), static_cast<int>(modulus.size()), nullptr)};
		BigNum e{BN_new()};
		if (!n || !e || (BN_set_word(e.get(), RsaExponent) != 1))
		{
			return nullptr;
		}
		ParamBuilder builder{OSSL_PARAM_BLD_new()};
		if (!builder ||
		    (OSSL_PARAM_BLD_push_BN(
		       builder.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1) ||
		    (OSSL_PARAM_BLD_push_BN(
		       builder.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1))
		{
			return nullptr;
		}
		Params      params{OSSL_PARAM_BLD_to_param(builder.get())};
		PkeyContext context{EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr)};
		if (!params || !context || (EVP_PKEY_fromdata_init(context.get()) != 1))
		{
			return nullptr;
		}
		EVP_PKEY *key = nullptr;
		if (EVP_PKEY_fromdata(
		      context.get(), &key, EVP_PKEY_PUBLIC_KEY, params.get()) != 1)
		{
			return nullptr;
		}
		return Pkey{key};
	}
} // namespace

SoftwareCryptoEngine::SoftwareCryptoEngine(DeferredCallQueue &queue)
  : deferredCall(queue, *this)
{
}

int SoftwareCryptoEngine::verify_digest(CredentialsFormat        algorithm,
                                        std::span<const uint8_t> data,
                                        std::span<const uint8_t> expected,
                                        DigestVerifierClient    &client)
{
	if (request != Request::None)
	{
		return -EBUSY;
	}
	const EVP_MD *digest = digest_for(algorithm);
	if (digest == nullptr)
	{
		return -ENOTSUP;
	}
	if (expected.size() != static_cast<size_t>(EVP_MD_get_size(digest)))
	{
		return -EINVAL;
	}
	Debug::log("Queued {} over {} bytes", algorithm, data.size());
	request         = Request::Digest;
	this->algorithm = algorithm;
	this->data      = data;
	this->expected  = expected;
	digestClient    = &client;
	deferredCall.set();
	return 0;
}

int SoftwareCryptoEngine::verify_signature(std::span<const uint8_t> modulus,
                                           std::span<const uint8_t> signature,
                                           std::span<const uint8_t> message,
                                           SignatureVerifierClient &client)
{
	if (request != Request::None)
	{
		return -EBUSY;
	}
	if (modulus.empty() || (signature.size() != modulus.size()))
	{
		return -EINVAL;
	}
	Debug::log("Queued {}-bit RSA verification over {} bytes",
	           modulus.size() * 8,
	           message.size());
	request         = Request::Signature;
	this->modulus   = modulus;
	expected        = signature;
	data            = message;
	signatureClient = &client;
	deferredCall.set();
	return 0;
}

void SoftwareCryptoEngine::handle_deferred_call()
{
	Request finished = request;
	// Clear the request before calling the client so that it can issue
	// another one from the callback.
	request = Request::None;
	switch (finished)
	{
		case Request::None:
			break;
		case Request::Digest:
		{
			int ret = compute_digest();
			Debug::log("Digest result {}", ret);
			digestClient->verification_done(ret < 0 ? ret : 0, ret == 1);
			break;
		}
		case Request::Signature:
		{
			int ret = compute_signature();
			Debug::log("Signature result {}", ret);
			signatureClient->signature_done(ret < 0 ? ret : 0, ret == 1);
			break;
		}
	}
}

int SoftwareCryptoEngine::compute_digest()
{
	std::array<uint8_t, EVP_MAX_MD_SIZE> digest;
	unsigned int                         length = 0;
	if (EVP_Digest(data.data(),
	               data.size(),
	               digest.data(),
	               &length,
	               digest_for(algorithm),
	               nullptr) != 1)
	{
		report_openssl_error("EVP_Digest");
		return -EIO;
	}
	if (length != expected.size())
	{
		return 0;
	}
	return CRYPTO_memcmp(digest.data(), expected.data(), length) == 0 ? 1 : 0;
}

int SoftwareCryptoEngine::compute_signature()
{
	Pkey key = rsa_public_key(modulus);
	if (!key)
	{
		report_openssl_error("Building RSA key");
		return -EIO;
	}
	MdContext context{EVP_MD_CTX_new()};
	if (!context ||
	    (EVP_DigestVerifyInit(
	       context.get(), nullptr, EVP_sha512(), nullptr, key.get()) != 1))
	{
		report_openssl_error("EVP_DigestVerifyInit");
		return -EIO;
	}
	int ret = EVP_DigestVerify(context.get(),
	                           expected.data(),
	                           expected.size(),
	                           data.data(),
	                           data.size());
	if (ret == 1)
	{
		return 1;
	}
	// A bad signature is reported through the error queue as well, it is
	// not an engine failure.
	ERR_clear_error();
	return 0;
}
