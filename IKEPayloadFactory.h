#pragma once
#include "common.h"
#include "ByteReader.h"
#include "IKEPayload.h"
#include <utility>

class IKEPayloadFactory {
public:
    // Reads one generic header and its body from reader and decodes the body
    // as `type`. Returns the payload and the type of the payload after it.
    static std::pair<IKEPayload, PayloadType> decodeNext(PayloadType type, bool is_response,
                                                         ByteReader& reader);

    static IKEPayload decodeBody(PayloadType type, bool critical, bool is_response,
                                 ByteReader& body);

private:
    static IKEPayload decodeAuth(bool critical, ByteReader& body);
};
