#include "der_parser.h"
#include <openssl/err.h>

namespace xkms {
namespace certificate_parser {

DerParseResult DerParser::parse(const std::vector<uint8_t>& data) {
    DerParseResult result;
    result.fileSize = data.size();

    if (data.empty()) {
        result.errorMessage = "Empty data";
        return result;
    }

    result.isValidDer = isDerFormat(data);
    if (!result.isValidDer) {
        result.errorMessage = "Invalid DER structure";
        return result;
    }

    const unsigned char* dataPtr = data.data();
    X509* cert = d2i_X509(nullptr, &dataPtr, static_cast<long>(data.size()));
    if (cert) {
        result.certificate.reset(cert);
        result.success = true;
        return result;
    }
    ERR_clear_error();

    dataPtr = data.data();
    X509_CRL* crl = d2i_X509_CRL(nullptr, &dataPtr, static_cast<long>(data.size()));
    if (crl) {
        result.crl.reset(crl);
        result.success = true;
        return result;
    }

    unsigned long err = ERR_get_error();
    char errBuf[256];
    ERR_error_string_n(err, errBuf, sizeof(errBuf));
    ERR_clear_error();
    result.errorMessage = std::string("Failed to parse DER certificate or CRL: ") + errBuf;
    return result;
}

bool DerParser::isDerFormat(const std::vector<uint8_t>& data) {
    if (data.size() < 4) {
        return false;
    }

    // SEQUENCE tag
    if (data[0] != 0x30) {
        return false;
    }

    size_t objectSize = getDerObjectSize(data);
    return objectSize > 0 && data.size() >= objectSize;
}

size_t DerParser::getDerObjectSize(const std::vector<uint8_t>& data) {
    if (data.size() < 2 || data[0] != 0x30) {
        return 0;
    }

    uint8_t lengthByte = data[1];

    // Short form: 0x00-0x7F
    if (lengthByte <= 0x7F) {
        return 2 + static_cast<size_t>(lengthByte);
    }

    // Long form: 0x81-0x84 (1-4 length bytes)
    if (lengthByte < 0x81 || lengthByte > 0x84) {
        return 0;
    }
    size_t lengthBytes = lengthByte & 0x7F;
    if (data.size() < 2 + lengthBytes) {
        return 0;
    }

    size_t contentLength = 0;
    for (size_t i = 0; i < lengthBytes; i++) {
        contentLength = (contentLength << 8) | data[2 + i];
    }
    if (contentLength == 0) {
        return 0;
    }
    return 2 + lengthBytes + contentLength;
}

} // namespace certificate_parser
} // namespace xkms
