/**
 * @file motor_test.cpp
 * @brief EncosMotor against the mock bus: safety gate, heartbeat, status
 * round trip, observers.
 */

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "codec.hpp"
#include "mock_transport.hpp"
#include "motor.hpp"
#include "stats.hpp"
#include "test_harness.hpp"

using namespace encos;
using namespace std::chrono_literals;

static CanFrame frame(uint32_t id, std::array<uint8_t,8> d) {
    CanFrame f;
    f.id = id;
    f.data = d;
    return f;
}

static bool same_frame(const CanFrame& a, const CanFrame& b) {
    return a.id == b.id && a.dlc == b.dlc && a.data == b.data && a.extended == b.extended;
}

bool Test_AddressRange() {
    MockCanTransport bus;
    for (int bad : {0, 33}) {
        bool threw = false;
        try {
            EncosMotor m(bus, (uint8_t)bad);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
    }
    EncosMotor ok(bus, 32);
    ASSERT_EQ(int(ok.address()), 32);
    return true;
}

bool Test_SafetyGate_Position() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    auto stats = std::make_shared<Stats>();
    SafetyLimits lim;
    lim.max_position_deg = 90.0;
    EncosMotor m(bus, 1, lim, stats);

    ASSERT_TRUE(!m.set_position(180.0));
    ASSERT_TRUE(!m.set_position(-90.5));
    ASSERT_EQ(bus.sent_count(), 0u);
    ASSERT_EQ(stats->snapshot(1).rejected, 2u);

    ASSERT_TRUE(m.set_position(45.0));
    ASSERT_EQ(bus.sent_count(), 1u);
    ASSERT_TRUE(same_frame(bus.sent_frames()[0], encode_servo_position(1, 45.0, 100.0, 5.0)));

    // boundary is inclusive
    ASSERT_TRUE(m.set_position(-90.0));
    ASSERT_EQ(stats->snapshot(1).tx_ok, 2u);
    return true;
}

bool Test_SafetyGate_VelocityCurrentTorque() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 2);  // defaults: 360 deg, 1000 RPM, 10 A, 5 Nm

    ASSERT_TRUE(!m.set_velocity(1000.1));
    ASSERT_TRUE(!m.set_velocity(-2000.0));
    ASSERT_TRUE(!m.set_velocity(10.0, 10.5));
    ASSERT_TRUE(!m.set_position(10.0, 1500.0));
    ASSERT_TRUE(!m.set_position(10.0, 100.0, 11.0));
    ASSERT_TRUE(!m.set_force_position(10.0, 50.0, 5.0, 0.0, 5.5));
    ASSERT_TRUE(!m.set_force_position(400.0, 50.0, 5.0));
    ASSERT_EQ(bus.sent_count(), 0u);

    ASSERT_TRUE(m.set_velocity(-1000.0, 10.0));
    ASSERT_TRUE(same_frame(bus.sent_frames().back(), encode_servo_velocity(2, -1000.0, 10.0)));
    ASSERT_TRUE(m.set_force_position(30.0, 20.0, 2.0, 1.0, -5.0));
    ASSERT_TRUE(same_frame(bus.sent_frames().back(),
                           encode_force_position(2, 20.0, 2.0, deg2rad(30.0), 1.0, -5.0)));

    // only the upper bound applies to current
    ASSERT_TRUE(m.set_velocity(10.0, -1.0));
    return true;
}

bool Test_SafetyGate_NaN() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 3);
    const double nan = std::numeric_limits<double>::quiet_NaN();

    ASSERT_TRUE(!m.set_position(nan));
    ASSERT_TRUE(!m.set_position(10.0, nan));
    ASSERT_TRUE(!m.set_velocity(nan));
    ASSERT_TRUE(!m.set_velocity(10.0, nan));
    ASSERT_TRUE(!m.set_force_position(nan, 50.0, 5.0));
    ASSERT_TRUE(!m.set_force_position(0.0, 50.0, 5.0, 0.0, nan));
    ASSERT_EQ(bus.sent_count(), 0u);
    return true;
}

bool Test_ForceMode_Position() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 4);

    ASSERT_TRUE(m.set_position(60.0, 100.0, 5.0, MotorMode::Force));
    ASSERT_TRUE(same_frame(bus.sent_frames()[0],
                           encode_force_position(4, EncosMotor::kForceDefaultKp,
                                                 EncosMotor::kForceDefaultKd,
                                                 deg2rad(60.0), 0.0, 0.0)));
    return true;
}

bool Test_Stop() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 5);
    ASSERT_TRUE(m.stop());
    ASSERT_TRUE(same_frame(bus.sent_frames()[0], encode_servo_velocity(5, 0.0, 0.0)));
    return true;
}

bool Test_SendFailure() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    auto stats = std::make_shared<Stats>();
    EncosMotor m(bus, 6, {}, stats);

    bus.set_fail_sends(true);
    ASSERT_TRUE(!m.set_velocity(10.0));
    ASSERT_TRUE(!m.get_status(FeedbackKind::PosVelTorque, 50ms).has_value());
    ASSERT_EQ(stats->snapshot(6).tx_fail, 2u);
    ASSERT_EQ(stats->snapshot(6).timeouts, 0u);
    // a failed send does not arm the heartbeat
    ASSERT_TRUE(m.is_heartbeat_alive());
    ASSERT_TRUE(!m.info().ms_since_command.has_value());

    bus.set_fail_sends(false);
    bus.disconnect();
    ASSERT_TRUE(!m.set_velocity(10.0));
    return true;
}

/**
 * @brief Alive before any command, alive right after one, stale after the
 * 500 ms window. Status requests do not refresh it.
 */
bool Test_Heartbeat() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 7);

    ASSERT_TRUE(m.is_heartbeat_alive());
    ASSERT_TRUE(m.set_velocity(20.0));
    ASSERT_TRUE(m.is_heartbeat_alive());

    std::this_thread::sleep_for(600ms);
    ASSERT_TRUE(!m.is_heartbeat_alive());

    ASSERT_TRUE(!m.get_status(FeedbackKind::PosVelTorque, 20ms).has_value());
    ASSERT_TRUE(!m.is_heartbeat_alive());
    ASSERT_TRUE(!m.info().heartbeat_alive);
    ASSERT_TRUE(*m.info().ms_since_command >= 600);

    ASSERT_TRUE(m.set_position(0.0));
    ASSERT_TRUE(m.is_heartbeat_alive());
    return true;
}

bool Test_ConfigPacing() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 8);

    ASSERT_TRUE(m.config_pacing_ok());
    ASSERT_TRUE(m.set_zero_point());
    ASSERT_TRUE(!m.config_pacing_ok());
    // too soon: warned about, still sent
    ASSERT_TRUE(m.set_zero_point());
    ASSERT_EQ(bus.sent_count(), 2u);
    ASSERT_TRUE(same_frame(bus.sent_frames()[1], encode_set_zero(8)));

    std::this_thread::sleep_for(550ms);
    ASSERT_TRUE(m.config_pacing_ok());
    return true;
}

bool Test_GetStatus_Response() {
    MockCanTransport bus(5ms);
    ASSERT_TRUE(bus.connect());
    auto stats = std::make_shared<Stats>();
    EncosMotor m(bus, 1, {}, stats);

    const CanFrame reply = frame(1, {0x20, 0x10, 0x00, 0x01, 0x00, 0x00, 0x10, 0x1E});
    bus.set_response(1, encode_status_request(1, FeedbackKind::PosVelTorque).data, reply);

    ASSERT_TRUE(!m.last_status().has_value());
    auto s = m.get_status(FeedbackKind::PosVelTorque, 500ms);
    ASSERT_TRUE(s.has_value());
    ASSERT_NEAR(s->position_deg, 22.5, 1e-9);
    ASSERT_NEAR(s->velocity_rpm, 25.6, 1e-9);
    ASSERT_NEAR(s->torque_nm, 0.16, 1e-9);
    ASSERT_NEAR(s->temperature_c, 3.0, 1e-9);

    ASSERT_TRUE(m.last_status().has_value());
    ASSERT_NEAR(m.last_status()->position_deg, 22.5, 1e-9);
    ASSERT_EQ(stats->snapshot(1).rx_status, 1u);
    // the request itself does not count as a command
    ASSERT_TRUE(!m.info().ms_since_command.has_value());
    return true;
}

bool Test_GetStatus_Timeout() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    auto stats = std::make_shared<Stats>();
    EncosMotor m(bus, 2, {}, stats);

    const auto t0 = std::chrono::steady_clock::now();
    auto s = m.get_status(FeedbackKind::DeviceState, 100ms);
    const auto dt = std::chrono::steady_clock::now() - t0;

    ASSERT_TRUE(!s.has_value());
    ASSERT_TRUE(dt >= 100ms);
    ASSERT_TRUE(dt < 1s);
    ASSERT_EQ(stats->snapshot(2).timeouts, 1u);
    ASSERT_TRUE(same_frame(bus.sent_frames()[0], encode_status_request(2, FeedbackKind::DeviceState)));
    return true;
}

bool Test_GetStatus_Cancel() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 3);

    std::atomic<bool> cancel{false};
    std::thread canceller([&]{
        std::this_thread::sleep_for(50ms);
        cancel.store(true);
    });

    const auto t0 = std::chrono::steady_clock::now();
    auto s = m.get_status(FeedbackKind::PosVelTorque, 5s, &cancel);
    const auto dt = std::chrono::steady_clock::now() - t0;
    canceller.join();

    ASSERT_TRUE(!s.has_value());
    ASSERT_TRUE(dt < 1s);
    return true;
}

bool Test_Frames_ForOtherAddress() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    auto stats = std::make_shared<Stats>();
    EncosMotor m(bus, 4, {}, stats);

    bus.inject(frame(5, {0x20, 0x10, 0, 0, 0, 0, 0, 0}));
    CanFrame ext = frame(4, {0x20, 0x10, 0, 0, 0, 0, 0, 0});
    ext.extended = true;
    bus.inject(ext);
    ASSERT_TRUE(!m.last_status().has_value());

    // right address, unknown kind
    bus.inject(frame(4, {0xE0, 0, 0, 0, 0, 0, 0, 0}));
    ASSERT_TRUE(!m.last_status().has_value());
    ASSERT_EQ(stats->snapshot(4).decode_fail, 1u);
    return true;
}

bool Test_StatusObservers_Isolated() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 1);

    int calls = 0;
    double seen_temp = 0.0;
    m.add_status_callback("a_throws", [](const Status&) {
        throw std::runtime_error("observer failure");
    });
    m.add_status_callback("b_counts", [&](const Status& s) {
        ++calls;
        seen_temp = s.temperature_c;
    });

    bus.inject(frame(1, {0x20, 0, 0, 0, 0, 0, 0, 0x64}));
    ASSERT_EQ(calls, 1);
    ASSERT_NEAR(seen_temp, 10.0, 1e-9);
    ASSERT_TRUE(m.last_status().has_value());

    m.remove_status_callback("b_counts");
    bus.inject(frame(1, {0x20, 0, 0, 0, 0, 0, 0, 0x64}));
    ASSERT_EQ(calls, 1);

    // same name replaces
    m.add_status_callback("a_throws", [&](const Status&) { calls += 10; });
    bus.inject(frame(1, {0x20, 0, 0, 0, 0, 0, 0, 0x64}));
    ASSERT_EQ(calls, 11);
    return true;
}

bool Test_ErrorObservers() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    auto stats = std::make_shared<Stats>();
    EncosMotor m(bus, 9, {}, stats);

    int status_calls = 0;
    int error_calls = 0;
    ErrorKind last = ErrorKind::None;
    m.add_status_callback("s", [&](const Status&) { ++status_calls; });
    m.add_error_callback("boom", [](ErrorKind) { throw std::logic_error("bad observer"); });
    m.add_error_callback("e", [&](ErrorKind e) {
        ++error_calls;
        last = e;
    });

    bus.inject(frame(9, {0x20, 0, 0, 0, 0, 0, 0, 0}));
    ASSERT_EQ(status_calls, 1);
    ASSERT_EQ(error_calls, 0);

    bus.inject(frame(9, {0xA0, 0x08, 0, 0, 0, 0, 0, 0}));
    ASSERT_EQ(status_calls, 2);
    ASSERT_EQ(error_calls, 1);
    ASSERT_TRUE(last == ErrorKind::OverTemperature);
    ASSERT_TRUE(m.last_status()->has_error());
    ASSERT_EQ(stats->snapshot(9).rx_error, 1u);

    m.remove_error_callback("e");
    bus.inject(frame(9, {0xA0, 0x01, 0, 0, 0, 0, 0, 0}));
    ASSERT_EQ(error_calls, 1);
    return true;
}

bool Test_Unregisters_OnDestruction() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    int calls = 0;
    {
        EncosMotor m(bus, 1);
        m.add_status_callback("c", [&](const Status&) { ++calls; });
        bus.inject(frame(1, {0x20, 0, 0, 0, 0, 0, 0, 0}));
    }
    bus.inject(frame(1, {0x20, 0, 0, 0, 0, 0, 0, 0}));
    ASSERT_EQ(calls, 1);
    return true;
}

bool Test_Info_And_Limits() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    EncosMotor m(bus, 10);

    MotorInfo i = m.info();
    ASSERT_EQ(int(i.address), 10);
    ASSERT_NEAR(i.limits.max_position_deg, 360.0, 0.0);
    ASSERT_NEAR(i.limits.max_velocity_rpm, 1000.0, 0.0);
    ASSERT_NEAR(i.limits.max_current_a, 10.0, 0.0);
    ASSERT_NEAR(i.limits.max_torque_nm, 5.0, 0.0);
    ASSERT_TRUE(i.heartbeat_alive);
    ASSERT_TRUE(!i.last_status.has_value());

    SafetyLimits tight;
    tight.max_velocity_rpm = 50.0;
    m.set_limits(tight);
    ASSERT_TRUE(!m.set_velocity(60.0));
    ASSERT_TRUE(m.set_velocity(50.0));
    ASSERT_NEAR(m.limits().max_velocity_rpm, 50.0, 0.0);
    return true;
}

/**
 * @brief Frames stream in on one thread while another issues commands,
 * polls status and swaps observers.
 */
bool Test_Frames_WhileCommanding() {
    MockCanTransport bus;
    ASSERT_TRUE(bus.connect());
    auto stats = std::make_shared<Stats>();
    EncosMotor m(bus, 11, {}, stats);

    std::atomic<int> seen{0};
    m.add_status_callback("count", [&](const Status&) { seen.fetch_add(1); });

    std::atomic<bool> feeding{true};
    std::thread feeder([&]{
        for (int n = 0; feeding.load(); ++n) {
            bus.inject(frame(11, {0x20, 0x10, 0, 0, 0, 0, 0, 0x64}));
            if (n % 200 == 0) bus.inject(frame(11, {0xA0, 0x02, 0, 0, 0, 0, 0, 0}));
            std::this_thread::yield();
        }
    });

    std::atomic<int> replies{0};
    const bool done = finishes_within(10000ms, "commands under inbound traffic", [&]{
        for (int i = 0; i < 500; ++i) {
            m.set_velocity(10.0);
            m.add_status_callback("tmp", [](const Status&) {});
            m.add_error_callback("tmp", [](ErrorKind) {});
            if (m.get_status(FeedbackKind::PosVelTorque, 50ms)) replies.fetch_add(1);
            m.remove_status_callback("tmp");
            m.remove_error_callback("tmp");
            m.set_limits(SafetyLimits{});
            (void)m.info();
        }
    });
    feeding.store(false);
    feeder.join();

    ASSERT_TRUE(done);
    ASSERT_TRUE(seen.load() > 0);
    ASSERT_EQ(replies.load(), 500);
    ASSERT_EQ(stats->snapshot(11).tx_ok, 1000u);
    ASSERT_TRUE(m.last_status().has_value());
    return true;
}

int main() {
    return run_tests("EncosMotor", {
        {"Test_AddressRange", Test_AddressRange},
        {"Test_SafetyGate_Position", Test_SafetyGate_Position},
        {"Test_SafetyGate_VelocityCurrentTorque", Test_SafetyGate_VelocityCurrentTorque},
        {"Test_SafetyGate_NaN", Test_SafetyGate_NaN},
        {"Test_ForceMode_Position", Test_ForceMode_Position},
        {"Test_Stop", Test_Stop},
        {"Test_SendFailure", Test_SendFailure},
        {"Test_Heartbeat", Test_Heartbeat},
        {"Test_ConfigPacing", Test_ConfigPacing},
        {"Test_GetStatus_Response", Test_GetStatus_Response},
        {"Test_GetStatus_Timeout", Test_GetStatus_Timeout},
        {"Test_GetStatus_Cancel", Test_GetStatus_Cancel},
        {"Test_Frames_ForOtherAddress", Test_Frames_ForOtherAddress},
        {"Test_StatusObservers_Isolated", Test_StatusObservers_Isolated},
        {"Test_ErrorObservers", Test_ErrorObservers},
        {"Test_Unregisters_OnDestruction", Test_Unregisters_OnDestruction},
        {"Test_Info_And_Limits", Test_Info_And_Limits},
        {"Test_Frames_WhileCommanding", Test_Frames_WhileCommanding},
    });
}
