#ifndef DCPATH_PATH_SECRET_TLS_SESSION_H
#define DCPATH_PATH_SECRET_TLS_SESSION_H

#include <dcpath/config.h>
#include <dcpath/types.h>
#include <dcpath/result.h>
#include <cstdint>
#include <string>
#include <vector>

namespace dcpath {
namespace path {
namespace secret {

/**
 * The two outputs of a completed TLS 1.3 handshake that the path secret
 * core consumes.
 */
class DCPATH_API TlsSession {
public:
    virtual ~TlsSession() = default;

    /**
     * RFC 8446 section 7.5 exporter. Fills out with out.size() bytes.
     */
    virtual Result<void> tls_exporter(const std::string& label,
                                      const std::vector<uint8_t>& context,
                                      std::vector<uint8_t>& out) const = 0;

    virtual CipherSuite cipher_suite() const = 0;
};

} // namespace secret
} // namespace path
} // namespace dcpath

#endif // DCPATH_PATH_SECRET_TLS_SESSION_H
