#ifndef TEST_CERTIFICATE_HPP
#define TEST_CERTIFICATE_HPP

#include <string>

#include <openssl/ssl.h>

namespace test_support {

/**
 * TestCertificate - Self-signed RSA certificate for localhost, created at runtime
 *
 * The certificate carries subjectAltName DNS:localhost and IP:127.0.0.1, so
 * it verifies for both when passed as the client's ca.
 */
class TestCertificate {
public:
    TestCertificate();
    ~TestCertificate();

    TestCertificate(const TestCertificate&) = delete;
    TestCertificate& operator=(const TestCertificate&) = delete;

    const std::string& certPem() const { return cert_pem; }
    const std::string& keyPem() const { return key_pem; }

    /**
     * Server-side context presenting this certificate
     */
    SSL_CTX* serverContext() const { return server_ctx; }

    /**
     * Shared instance, generated once per test run
     */
    static const TestCertificate& instance();

private:
    std::string cert_pem;
    std::string key_pem;
    SSL_CTX* server_ctx;
};

} // namespace test_support

#endif // TEST_CERTIFICATE_HPP
