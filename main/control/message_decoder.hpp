#ifndef MESSAGE_DECODER_HPP
#define MESSAGE_DECODER_HPP

#include <cstdint>
#include <main/models/inbound_message.hpp>

namespace MessageDecoder {
    // Resolves the topic once; payload is copied, trimmed and truncated to fit
    InboundMessage decode(const char* topic, const uint8_t* payload, int length);

    const char* kindName(MessageKind kind);
}

#endif // MESSAGE_DECODER_HPP
