
#include "Application/Apps/echo_app.hpp"
#include "Drivers/Runtime/Log.hpp"

#include <cstdio>

using namespace nusense;
using Drivers::Usb::AcmStatus;

EchoApp::EchoApp (Drivers::Usb::AcmConnection &acm) : acm(acm) {
    NUSENSE_LOG_INFO("Echo application started");
}

bool EchoApp::isText (const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; i ++) {
        const uint8_t c = data[i];
        const bool printable  = c >= 0x20 && c < 0x7F;
        const bool whitespace = c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        if (!printable && !whitespace) return false;
    }
    return true;
}

size_t EchoApp::hexPreview (const uint8_t* data, size_t len, char* out, size_t outSize) {
    if (outSize == 0) return 0;
    out[0] = '\0';

    const size_t shown = len < ECHO_PREVIEW_BYTES ? len : ECHO_PREVIEW_BYTES;
    size_t used = 0;
    for (size_t i = 0; i < shown; i ++) {
        // "xx" plus a separator, and the terminator
        if (used + 4 > outSize) break;
        used += (size_t) snprintf(out + used, outSize - used, i == 0 ? "%02x" : " %02x", data[i]);
    }
    return used;
}

uint32_t EchoApp::utilizationPercent (size_t len) {
    return (uint32_t) ((len * 100) / config::USB_MAX_PACKET_SIZE);
}

void EchoApp::logPacket (size_t len) const {
    NUSENSE_LOG_INFO("Received %u bytes packet (buffer utilization: %lu%%)",
        (unsigned) len, (unsigned long) utilizationPercent(len));

    if (isText(buffer, len)) {
        const int shown = (int) (len < ECHO_PREVIEW_BYTES ? len : ECHO_PREVIEW_BYTES);
        NUSENSE_LOG_INFO("Received text packet: '%.*s'", shown, reinterpret_cast<const char*>(buffer));
    } else {
        char preview[ECHO_PREVIEW_BYTES * 3 + 1];
        hexPreview(buffer, len, preview, sizeof(preview));
        NUSENSE_LOG_INFO("Received binary packet (showing first %u bytes): %s",
            (unsigned) ECHO_PREVIEW_BYTES, preview);
    }
}

void EchoApp::connectionLost () {
    lost ++;
    NUSENSE_LOG_WARN("Echo loop: Connection lost, will reconnect...");
    reconnectTimer.start(config::ECHO_RECONNECT_DELAY_MS);
    current = Phase::RECONNECT_DELAY;
}

void EchoApp::receive () {
    size_t received = 0;
    switch (acm.receivePacket(buffer, sizeof(buffer), received)) {
        case AcmStatus::OK:
            logPacket(received);
            pendingLength = received;
            current = Phase::SEND;
            send();
            return;
        case AcmStatus::PENDING:
        case AcmStatus::BUSY:
            return;
        case AcmStatus::ERROR_DISCONNECTED:
            connectionLost();
            return;
    }
}

void EchoApp::send () {
    switch (acm.sendPacket(buffer, pendingLength)) {
        case AcmStatus::OK:
            echoed ++;
            NUSENSE_LOG_INFO("Echoed %u bytes packet back to host", (unsigned) pendingLength);
            current = Phase::RECEIVE;
            return;
        case AcmStatus::PENDING:
        case AcmStatus::BUSY:
            return;
        case AcmStatus::ERROR_DISCONNECTED:
            connectionLost();
            return;
    }
}

void EchoApp::poll () {
    switch (current) {
        case Phase::WAIT_CONNECTION:
            if (!acm.waitConnection()) return;
            NUSENSE_LOG_INFO("Echo app: Host connected, starting echo loop");
            current = Phase::RECEIVE;
            receive();
            return;
        case Phase::RECEIVE:
            receive();
            return;
        case Phase::SEND:
            send();
            return;
        case Phase::RECONNECT_DELAY:
            if (!reconnectTimer.expired()) return;
            current = Phase::WAIT_CONNECTION;
            return;
    }
}
