
#ifndef APP_ECHO_APP_H
#define APP_ECHO_APP_H

#include <cstddef>
#include <cstdint>

#include "Application/Config/config.hpp"
#include "Drivers/Runtime/Deadline.hpp"
#include "Drivers/Runtime/Task.hpp"
#include "Drivers/Usb/AcmConnection.hpp"

namespace nusense {
    /** Number of bytes shown when logging a packet */
    static constexpr size_t ECHO_PREVIEW_BYTES = 32;

    /**
     * Sends every packet received on the virtual serial port back to the
     * host, unchanged. Waits for the host to reopen the port when the
     * connection drops.
     */
    class EchoApp : public Drivers::Runtime::Task {
    public:
        enum class Phase {
            WAIT_CONNECTION,
            RECEIVE,
            SEND,
            RECONNECT_DELAY
        };

        explicit EchoApp (Drivers::Usb::AcmConnection &acm);

        const char* name () const override { return "echo"; }
        void poll () override;

        Phase phase () const { return current; }
        uint32_t packetsEchoed () const { return echoed; }
        uint32_t disconnects () const { return lost; }

        /** Printable ASCII and whitespace only */
        static bool isText (const uint8_t* data, size_t len);
        /**
         * Hex dump of the first ECHO_PREVIEW_BYTES bytes, "de ad be ef".
         * Always null-terminated; returns the string length.
         */
        static size_t hexPreview (const uint8_t* data, size_t len, char* out, size_t outSize);
        static uint32_t utilizationPercent (size_t len);

    private:
        void receive ();
        void send ();
        void connectionLost ();
        void logPacket (size_t len) const;

        Drivers::Usb::AcmConnection &acm;
        Phase current = Phase::WAIT_CONNECTION;
        Drivers::Runtime::Deadline reconnectTimer;

        uint8_t buffer[config::USB_MAX_PACKET_SIZE];
        size_t pendingLength = 0;

        uint32_t echoed = 0;
        uint32_t lost = 0;
    };
};

#endif /* APP_ECHO_APP_H */
