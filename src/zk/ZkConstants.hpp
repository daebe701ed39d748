#pragma once
#include <QtGlobal>

// Command and flag values of the ZKTeco TCP protocol used by the driver.
class ZkConstant {
public:
    // Command codes
    static constexpr quint16 CMD_USERTEMP_RRQ = 9;
    static constexpr quint16 CMD_OPTIONS_RRQ = 11;
    static constexpr quint16 CMD_ATTLOG_RRQ = 13;
    static constexpr quint16 CMD_GET_FREE_SIZES = 50;
    static constexpr quint16 CMD_STARTVERIFY = 60;
    static constexpr quint16 CMD_CANCELCAPTURE = 62;
    static constexpr quint16 CMD_REG_EVENT = 500;

    static constexpr quint16 CMD_CONNECT = 1000;
    static constexpr quint16 CMD_EXIT = 1001;
    static constexpr quint16 CMD_ENABLEDEVICE = 1002;
    static constexpr quint16 CMD_AUTH = 1102;

    static constexpr quint16 CMD_PREPARE_DATA = 1500;
    static constexpr quint16 CMD_DATA = 1501;
    static constexpr quint16 CMD_FREE_DATA = 1502;
    static constexpr quint16 CMD_PREPARE_BUFFER = 1503;
    static constexpr quint16 CMD_READ_BUFFER = 1504;

    // Replies
    static constexpr quint16 CMD_ACK_OK = 2000;
    static constexpr quint16 CMD_ACK_ERROR = 2001;
    static constexpr quint16 CMD_ACK_DATA = 2002;
    static constexpr quint16 CMD_ACK_UNAUTH = 2005;

    // Event flags for CMD_REG_EVENT
    static constexpr quint32 EF_ATTLOG = 1;

    static constexpr quint32 FCT_USER = 5;

    // TCP framing
    static constexpr quint16 MACHINE_PREPARE_DATA_1 = 20560;   // 0x5050
    static constexpr quint16 MACHINE_PREPARE_DATA_2 = 32130;   // 0x7282

    static constexpr quint16 USHRT_LIMIT = 65535;
    static constexpr int HEADER_SIZE = 8;
    static constexpr int TOP_SIZE = 8;
    static constexpr int MAX_CHUNK = 0xFFC0;
    static constexpr int MAX_USER_RECORD = 72;
    static constexpr int MAX_ATTLOG_RECORD = 64;
    static constexpr int BUFFER_SLACK_RECORDS = 64;     // records added between size query and read
    static constexpr int DEFAULT_PORT = 4370;
};
