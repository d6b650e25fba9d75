/*
 * spin_flyer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: SpinFlyer, the fly scan controller coordinating an actuator, a
capture device and a busy record

**************************************************/

#ifndef FLYSCAN_DEVICE_FLYER_SPIN_FLYER_HPP
#define FLYSCAN_DEVICE_FLYER_SPIN_FLYER_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "acquisition_types.hpp"
#include "busy_guard.hpp"
#include "completion_status.hpp"
#include "config/sections/flyer_config.hpp"
#include "device/template/actuator.hpp"
#include "device/template/busy_flag.hpp"
#include "device/template/capture_device.hpp"
#include "record_stream.hpp"
#include "spin_sequence.hpp"

namespace flyscan::device {

/**
 * @brief Fly scan controller
 *
 * Two interfaces share one background task slot:
 *
 * - set("taxi" | "fly" | "return") runs a single action, gated by the busy
 *   record.
 * - kickoff() / complete() / collect() runs config.numCycles spin cycles and
 *   hands out the records, gated by the held CompletionStatus.
 *
 * The busy record is set for the whole of any action or run and is cleared
 * on every exit path before the status resolves. Hardware handles are not
 * owned and must outlive the flyer. The destructor waits for the running
 * task, unless it runs inside one of that task's completion callbacks.
 */
class SpinFlyer {
public:
    /**
     * @throws DeviceValidationException (ConfigurationError) if @p config
     *         does not validate
     */
    SpinFlyer(std::string name, AtomActuator& actuator,
              AtomCaptureDevice& capture, AtomBusyFlag& busy,
              config::FlyerConfig config);
    ~SpinFlyer();

    SpinFlyer(const SpinFlyer&) = delete;
    SpinFlyer& operator=(const SpinFlyer&) = delete;

    // ========== Command Interface ==========

    /**
     * @brief Start "taxi", "fly" or "return" on a background task
     *
     * taxi records the current position as the return position before
     * moving to the run-up position.
     *
     * @throws DeviceValidationException for any other token
     * @throws DeviceConcurrencyException if the busy record is set, or for
     *         "return" when no return position was recorded
     */
    auto set(std::string_view command) -> CompletionStatusPtr;

    // ========== Fly Protocol ==========

    /**
     * @brief Clear the buffer, record the return position, start the run
     * @throws DeviceConcurrencyException if a run is in progress, a
     *         successful run was not collected, or the busy record is set
     */
    auto kickoff() -> CompletionStatusPtr;

    /**
     * @brief Poll until the actuator is idle and the run has resolved
     * @throws DeviceConcurrencyException without a prior kickoff
     * @throws DeviceTimeoutException after config.completeTimeoutMs
     */
    auto complete() -> CompletionStatusPtr;

    /**
     * @brief Drain the records of a resolved run
     *
     * Clears the held status. A failed run discards its records and its
     * error is rethrown.
     *
     * @throws DeviceConcurrencyException if no run is held or it is still
     *         unresolved
     */
    auto collect() -> RecordStream;

    /**
     * @brief {streamName: {field: descriptor}} from the capture device
     */
    [[nodiscard]] auto describeCollect() const -> nlohmann::json;

    // ========== Introspection ==========

    [[nodiscard]] auto readConfiguration() const -> nlohmann::json;
    [[nodiscard]] auto describeConfiguration() const -> nlohmann::json;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto config() const -> const config::FlyerConfig& {
        return config_;
    }
    [[nodiscard]] auto state() const -> AcquisitionState { return state_; }
    [[nodiscard]] auto phase() const -> ProtocolPhase;
    [[nodiscard]] auto returnPosition() const -> std::optional<double>;
    [[nodiscard]] auto bufferedRecords() const -> size_t;

private:
    // Sets the busy record, giving up the reserved task slot on failure
    auto claimBusy() -> BusyGuard;

    // Caller holds mutex_; returns the replaced worker for retire()
    auto launch(CompletionStatusPtr status, BusyGuard guard,
                std::function<void()> body) -> std::jthread;

    auto spawn(CompletionStatusPtr status, BusyGuard guard,
               std::function<void()> body) -> std::jthread;

    // Joins a finished worker, or detaches it when called from that worker
    static void retire(std::jthread& worker);

    void appendRecord(AcquisitionRecord record);

    std::string name_;
    AtomActuator& actuator_;
    AtomCaptureDevice& capture_;
    AtomBusyFlag& busy_;
    config::FlyerConfig config_;
    SpinSequence sequence_;

    std::atomic<AcquisitionState> state_{AcquisitionState::Idle};

    mutable std::mutex mutex_;
    CompletionStatusPtr run_status_;
    std::vector<AcquisitionRecord> buffer_;
    std::optional<double> return_position_;
    bool task_active_{false};
    std::jthread worker_;
};

}  // namespace flyscan::device

#endif  // FLYSCAN_DEVICE_FLYER_SPIN_FLYER_HPP
