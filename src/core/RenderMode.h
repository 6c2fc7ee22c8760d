#pragma once

// ============================================================================
// RenderMode.h - Host/device culling strategy selector
// ============================================================================
//
// The renderer picks one CullingStrategy at construction and never changes it.
// Anything whose shape depends on the strategy is carried in a ModeData, a
// closed two-case variant. Consumers either branch once with match(), which
// requires a handler for both cases, or read the case they expect with
// asHost()/asDevice(), which raise StrategyMismatchError on the wrong case.
//

#include "CullingErrors.h"

#include <type_traits>
#include <utility>
#include <variant>

enum class CullingStrategy {
    Host,
    Device
};

inline const char* toString(CullingStrategy strategy) {
    switch (strategy) {
        case CullingStrategy::Host:   return "host";
        case CullingStrategy::Device: return "device";
    }
    return "unknown";
}

template<typename HostT, typename DeviceT>
class ModeData {
public:
    using HostType = HostT;
    using DeviceType = DeviceT;

    static ModeData host(HostT value) {
        return ModeData(std::in_place_index<0>, std::move(value));
    }

    static ModeData device(DeviceT value) {
        return ModeData(std::in_place_index<1>, std::move(value));
    }

    CullingStrategy strategy() const {
        return data_.index() == 0 ? CullingStrategy::Host : CullingStrategy::Device;
    }

    bool isHost() const { return data_.index() == 0; }
    bool isDevice() const { return data_.index() == 1; }

    HostT& asHost() {
        requireStrategy(CullingStrategy::Host);
        return std::get<0>(data_);
    }

    const HostT& asHost() const {
        requireStrategy(CullingStrategy::Host);
        return std::get<0>(data_);
    }

    DeviceT& asDevice() {
        requireStrategy(CullingStrategy::Device);
        return std::get<1>(data_);
    }

    const DeviceT& asDevice() const {
        requireStrategy(CullingStrategy::Device);
        return std::get<1>(data_);
    }

    // Exhaustive branch: both handlers are mandatory and must return the same type
    template<typename OnHost, typename OnDevice>
    decltype(auto) match(OnHost&& onHost, OnDevice&& onDevice) {
        static_assert(std::is_same_v<std::invoke_result_t<OnHost, HostT&>,
                                     std::invoke_result_t<OnDevice, DeviceT&>>,
                      "ModeData::match handlers must return the same type");
        if (data_.index() == 0) {
            return std::forward<OnHost>(onHost)(std::get<0>(data_));
        }
        return std::forward<OnDevice>(onDevice)(std::get<1>(data_));
    }

    template<typename OnHost, typename OnDevice>
    decltype(auto) match(OnHost&& onHost, OnDevice&& onDevice) const {
        static_assert(std::is_same_v<std::invoke_result_t<OnHost, const HostT&>,
                                     std::invoke_result_t<OnDevice, const DeviceT&>>,
                      "ModeData::match handlers must return the same type");
        if (data_.index() == 0) {
            return std::forward<OnHost>(onHost)(std::get<0>(data_));
        }
        return std::forward<OnDevice>(onDevice)(std::get<1>(data_));
    }

    // Transform each case independently, keeping the tag
    template<typename OnHost, typename OnDevice>
    auto map(OnHost&& onHost, OnDevice&& onDevice) const
        -> ModeData<std::invoke_result_t<OnHost, const HostT&>,
                    std::invoke_result_t<OnDevice, const DeviceT&>> {
        using Result = ModeData<std::invoke_result_t<OnHost, const HostT&>,
                                std::invoke_result_t<OnDevice, const DeviceT&>>;
        if (data_.index() == 0) {
            return Result::host(std::forward<OnHost>(onHost)(std::get<0>(data_)));
        }
        return Result::device(std::forward<OnDevice>(onDevice)(std::get<1>(data_)));
    }

private:
    template<std::size_t I, typename V>
    ModeData(std::in_place_index_t<I> tag, V&& value)
        : data_(tag, std::forward<V>(value)) {}

    void requireStrategy(CullingStrategy expected) const {
        if (strategy() != expected) {
            CullingErrors::fail<StrategyMismatchError>(
                "ModeData: expected %s data but holds %s data",
                toString(expected), toString(strategy()));
        }
    }

    std::variant<HostT, DeviceT> data_;
};
