#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <cstdint>

// Remote commands accepted on em1003/<id>/cmd
enum class CommandType : int32_t {
    BUZZER_ON = 0,
    BUZZER_OFF = 1,
    BUZZER_QUERY = 2,
    REFRESH = 3,
    SET_POLL_INTERVAL = 4,      // value = seconds
    SET_DISCONNECT_POLICY = 5,  // value = DisconnectPolicy
};

// Fixed-size command container for inter-task messaging
struct Command {
    uint32_t    timestamp_ms;   // time command was received
    CommandType type;
    int32_t     value;          // optional numeric argument
    char        request_id[24]; // echoed in the ack, empty when the sender gave none
};

#endif // COMMAND_HPP
