/*
 * spin_flyer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "spin_flyer.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "device/common/device_exceptions.hpp"

namespace flyscan::device {

namespace {

auto checkedConfig(config::FlyerConfig config, const std::string& name)
    -> config::FlyerConfig {
    auto validation = config.validate();
    if (!validation) {
        throw DeviceValidationException(
            "Invalid flyer configuration: " + validation.summary(), name,
            DeviceErrorCode::ConfigurationError);
    }
    return config;
}

auto describeFailure(const std::exception_ptr& failure) -> std::string {
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}  // namespace

SpinFlyer::SpinFlyer(std::string name, AtomActuator& actuator,
                     AtomCaptureDevice& capture, AtomBusyFlag& busy,
                     config::FlyerConfig config)
    : name_(std::move(name)),
      actuator_(actuator),
      capture_(capture),
      busy_(busy),
      config_(checkedConfig(std::move(config), name_)),
      sequence_(name_, actuator_, capture_, config_,
                [this](AcquisitionState state) { state_ = state; }) {
    spdlog::info("[SpinFlyer:{}] Created with {} cycle(s), {} -> {}", name_,
                 config_.numCycles, config_.taxiPosition(),
                 config_.finishPosition);
}

SpinFlyer::~SpinFlyer() {
    std::jthread worker;
    {
        std::lock_guard lock(mutex_);
        worker = std::move(worker_);
    }
    retire(worker);
}

auto SpinFlyer::set(std::string_view command) -> CompletionStatusPtr {
    const auto parsed = valueOrThrow(parseFlyerCommand(command));

    if (busy_.get()) {
        throw DeviceConcurrencyException("Operation already in progress",
                                         name_);
    }
    std::optional<double> origin;
    if (parsed == FlyerCommand::Taxi) {
        origin = actuator_.getPosition();
    }

    auto status =
        std::make_shared<CompletionStatus>(flyerCommandToString(parsed));
    std::function<void()> action;
    {
        std::lock_guard lock(mutex_);
        if (task_active_) {
            throw DeviceConcurrencyException("Operation already in progress",
                                             name_);
        }
        switch (parsed) {
            case FlyerCommand::Taxi:
                action = [this] { sequence_.taxi(); };
                break;
            case FlyerCommand::Fly:
                action = [this] { sequence_.fly(); };
                break;
            case FlyerCommand::Return:
                if (!return_position_) {
                    throw DeviceConcurrencyException(
                        "No return position recorded, taxi or kickoff first",
                        name_);
                }
                action = [this, target = *return_position_] {
                    sequence_.returnTo(target);
                };
                break;
        }
        task_active_ = true;
    }

    BusyGuard guard = claimBusy();

    std::jthread previous;
    {
        std::lock_guard lock(mutex_);
        if (origin) {
            return_position_ = origin;
        }
        spdlog::info("[SpinFlyer:{}] Command '{}' started", name_,
                     status->operation());
        previous = launch(status, std::move(guard), std::move(action));
    }
    retire(previous);
    return status;
}

auto SpinFlyer::kickoff() -> CompletionStatusPtr {
    if (busy_.get()) {
        throw DeviceConcurrencyException("Operation already in progress",
                                         name_);
    }
    const double origin = actuator_.getPosition();

    auto status = std::make_shared<CompletionStatus>("kickoff");
    {
        std::lock_guard lock(mutex_);
        if (run_status_) {
            if (!run_status_->done()) {
                throw DeviceConcurrencyException(
                    "Kickoff requested while a run is in progress", name_);
            }
            if (run_status_->success().value_or(false)) {
                throw DeviceConcurrencyException(
                    "Kickoff requested before the previous run was collected",
                    name_);
            }
        }
        if (task_active_) {
            throw DeviceConcurrencyException("Operation already in progress",
                                             name_);
        }
        task_active_ = true;
    }

    BusyGuard guard = claimBusy();

    std::jthread previous;
    {
        std::lock_guard lock(mutex_);
        buffer_.clear();
        return_position_ = origin;
        run_status_ = status;
        spdlog::info("[SpinFlyer:{}] Kickoff from {}", name_, origin);
        previous = launch(status, std::move(guard), [this, origin] {
            sequence_.run(origin, [this](AcquisitionRecord record) {
                appendRecord(std::move(record));
            });
        });
    }
    retire(previous);
    return status;
}

auto SpinFlyer::complete() -> CompletionStatusPtr {
    CompletionStatusPtr status;
    {
        std::lock_guard lock(mutex_);
        status = run_status_;
    }
    if (!status) {
        throw DeviceConcurrencyException("Complete requested before kickoff",
                                         name_);
    }

    const auto timeout = std::chrono::milliseconds(config_.completeTimeoutMs);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (actuator_.isMoving() || !status->done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw DeviceTimeoutException(name_, "complete",
                                         static_cast<int>(timeout.count()));
        }
        std::this_thread::sleep_for(config_.pollInterval());
    }
    return status;
}

auto SpinFlyer::collect() -> RecordStream {
    std::lock_guard lock(mutex_);
    if (!run_status_ || !run_status_->done()) {
        throw DeviceConcurrencyException("No reading until done", name_);
    }

    auto status = std::exchange(run_status_, nullptr);
    auto records = std::exchange(buffer_, {});
    if (!status->success().value_or(false)) {
        spdlog::warn("[SpinFlyer:{}] Discarding {} record(s) of a failed run",
                     name_, records.size());
        status->rethrowIfFailed();
        throw DeviceOperationException("Run failed", name_, "kickoff");
    }

    spdlog::info("[SpinFlyer:{}] Collected {} record(s)", name_,
                 records.size());
    return RecordStream(std::move(records));
}

auto SpinFlyer::describeCollect() const -> nlohmann::json {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& [field, reading] : capture_.resultDescriptor()) {
        fields[field] = reading.schema;
    }
    return {{config_.streamName, fields}};
}

auto SpinFlyer::readConfiguration() const -> nlohmann::json {
    return config_.toJson();
}

auto SpinFlyer::describeConfiguration() const -> nlohmann::json {
    auto description = actuator_.describeConfiguration();
    description.update(capture_.describeConfiguration());
    description.update(busy_.describeConfiguration());
    return description;
}

auto SpinFlyer::phase() const -> ProtocolPhase {
    std::lock_guard lock(mutex_);
    if (!run_status_) {
        return ProtocolPhase::Idle;
    }
    return run_status_->done() ? ProtocolPhase::Completed
                               : ProtocolPhase::Running;
}

auto SpinFlyer::returnPosition() const -> std::optional<double> {
    std::lock_guard lock(mutex_);
    return return_position_;
}

auto SpinFlyer::bufferedRecords() const -> size_t {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

void SpinFlyer::appendRecord(AcquisitionRecord record) {
    std::lock_guard lock(mutex_);
    spdlog::debug("[SpinFlyer:{}] Record {} appended", name_, record.seqNum);
    buffer_.push_back(std::move(record));
}

auto SpinFlyer::claimBusy() -> BusyGuard {
    try {
        return BusyGuard(busy_);
    } catch (...) {
        std::lock_guard lock(mutex_);
        task_active_ = false;
        throw;
    }
}

auto SpinFlyer::launch(CompletionStatusPtr status, BusyGuard guard,
                       std::function<void()> body) -> std::jthread {
    std::jthread next;
    try {
        next = spawn(std::move(status), std::move(guard), std::move(body));
    } catch (...) {
        task_active_ = false;
        throw;
    }
    return std::exchange(worker_, std::move(next));
}

void SpinFlyer::retire(std::jthread& worker) {
    if (!worker.joinable()) {
        return;
    }
    // A completion callback runs on the worker it belongs to
    if (worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
    } else {
        worker.join();
    }
}

auto SpinFlyer::spawn(CompletionStatusPtr status, BusyGuard guard,
                      std::function<void()> body) -> std::jthread {
    return std::jthread([this, status = std::move(status),
                         guard = std::move(guard),
                         body = std::move(body)]() mutable {
        std::exception_ptr failure;
        try {
            body();
        } catch (...) {
            failure = std::current_exception();
        }

        state_ = AcquisitionState::Idle;
        try {
            guard.release();
        } catch (...) {
            if (!failure) {
                failure = std::current_exception();
            }
        }

        {
            std::lock_guard lock(mutex_);
            task_active_ = false;
        }

        // Callbacks may start the next task or destroy the flyer, so the
        // flyer is not touched after resolution
        if (failure) {
            spdlog::error("[SpinFlyer:{}] '{}' failed: {}", name_,
                          status->operation(), describeFailure(failure));
            status->setFailed(failure);
        } else {
            spdlog::info("[SpinFlyer:{}] '{}' finished in {} ms", name_,
                         status->operation(), status->elapsed().count());
            status->setFinished();
        }
    });
}

}  // namespace flyscan::device
