#include <gtest/gtest.h>
#include <anemo/hardware/posix_serial_port.hpp>
#include <atomic>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {
    // Pseudo-terminal standing in for a USB serial adapter
    class PtyDevice {
    public:
        PtyDevice() : master(-1) {
            master = ::posix_openpt(O_RDWR | O_NOCTTY);
            if (master < 0) {
                return;
            }
            if (::grantpt(master) != 0 || ::unlockpt(master) != 0) {
                closeMaster();
                return;
            }
            const char* name = ::ptsname(master);
            if (name == nullptr) {
                closeMaster();
                return;
            }
            slave_path = name;
        }

        ~PtyDevice() { closeMaster(); }

        bool valid() const { return master >= 0; }
        const std::string& path() const { return slave_path; }

        bool send(const std::string& text) {
            return ::write(master, text.data(), text.size()) == static_cast<ssize_t>(text.size());
        }

        // Hangs up the device side
        void closeMaster() {
            if (master >= 0) {
                ::close(master);
                master = -1;
            }
        }

    private:
        int master;
        std::string slave_path;
    };

    bool isKnownFailure(const std::string& text) {
        static const char* prefixes[] = {
            "write failed", "write timed out", "read failed", "poll failed", "device disconnected",
            "tcdrain failed", "port not open"
        };
        for (const char* prefix : prefixes) {
            if (text.compare(0, std::string(prefix).size(), prefix) == 0) {
                return true;
            }
        }
        return false;
    }
}

TEST(PosixSerialPort, SupportedBaudRates) {
    speed_t speed;
    EXPECT_TRUE(PosixSerialPort::baudToSpeed(9600, speed));
    EXPECT_EQ(static_cast<speed_t>(B9600), speed);
    EXPECT_TRUE(PosixSerialPort::baudToSpeed(115200, speed));
    EXPECT_EQ(static_cast<speed_t>(B115200), speed);
    EXPECT_FALSE(PosixSerialPort::baudToSpeed(1234, speed));
}

TEST(PosixSerialPort, OpenFailureKeepsReason) {
    PosixSerialPort port;
    EXPECT_FALSE(port.open("/dev/anemo-no-such-port", 115200));
    EXPECT_FALSE(port.isOpen());
    EXPECT_EQ(0u, port.lastError().find("open failed"));
}

TEST(PosixSerialPort, ReadsLinesFromDevice) {
    PtyDevice device;
    if (!device.valid()) {
        GTEST_SKIP() << "no pseudo-terminal available";
    }
    PosixSerialPort port;
    ASSERT_TRUE(port.open(device.path(), 115200)) << port.lastError();

    ASSERT_TRUE(device.send("S 1 D 2\r\nparti"));
    std::string line;
    ASSERT_EQ(ReadStatus::LINE, port.readLine(line, 500));
    EXPECT_EQ("S 1 D 2", line);
    EXPECT_EQ(ReadStatus::TIMEOUT, port.readLine(line, 100));
    EXPECT_EQ("parti", line);

    port.close();
    EXPECT_FALSE(port.isOpen());
    EXPECT_EQ(ReadStatus::ERROR, port.readLine(line, 10));
    EXPECT_EQ("port not open", port.lastError());
}

TEST(PosixSerialPort, ErrorTextStaysIntactAcrossReaderAndWriter) {
    PtyDevice device;
    if (!device.valid()) {
        GTEST_SKIP() << "no pseudo-terminal available";
    }
    PosixSerialPort port;
    ASSERT_TRUE(port.open(device.path(), 115200)) << port.lastError();
    device.closeMaster();

    // Writer thread fails and records errors while the reader hits the hangup
    std::atomic<bool> done(false);
    std::vector<std::string> writer_seen;
    std::thread writer([&port, &done, &writer_seen]() {
        const uint8_t byte = 'x';
        while (!done.load()) {
            if (!port.write(&byte, 1)) {
                writer_seen.push_back(port.lastError());
            }
            if (writer_seen.size() >= 200) {
                break;
            }
        }
    });

    std::vector<std::string> reader_seen;
    std::string line;
    for (int i = 0; i < 200; ++i) {
        if (port.readLine(line, 5) == ReadStatus::ERROR) {
            reader_seen.push_back(port.lastError());
        }
    }
    done = true;
    writer.join();

    EXPECT_FALSE(reader_seen.empty());
    for (const std::string& text : reader_seen) {
        EXPECT_TRUE(isKnownFailure(text)) << text;
    }
    for (const std::string& text : writer_seen) {
        EXPECT_TRUE(isKnownFailure(text)) << text;
    }
    port.close();
}
