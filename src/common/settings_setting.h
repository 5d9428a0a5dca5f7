// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <algorithm>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <fmt/core.h>
#include "common/common_types.h"
#include "common/settings_common.h"

namespace Settings {

/** The Setting class is a simple resource manager. It defines a label and default value
 * alongside the actual value of the setting for simpler and less-error prone use with frontend
 * configurations. Specifying a default value and label is required. A minimum and maximum range
 * can be specified for sanitization.
 */
template <typename Type, bool ranged = false>
class Setting : public BasicSetting {
protected:
    Setting() = default;

public:
    /**
     * Sets a default value, label, and setting value.
     *
     * @param linkage Setting registry
     * @param default_val Initial value of the setting, and default value of the setting
     * @param name Label for the setting
     * @param category_ Category of the setting AKA INI group
     * @param specialization_ Suggestion for how frontend implementations represent this in a config
     * @param save_ Suggests that this should or should not be saved to a frontend config file
     */
    explicit Setting(Linkage& linkage, const Type& default_val, const std::string& name,
                     Category category_, u32 specialization_ = Specialization::Default,
                     bool save_ = true)
        requires(!ranged)
        : BasicSetting(linkage, name, category_, save_, specialization_), value{default_val},
          default_value{default_val} {}
    virtual ~Setting() = default;

    /**
     * Sets a default value, minimum value, maximum value, and label.
     *
     * @param linkage Setting registry
     * @param default_val Initial value of the setting, and default value of the setting
     * @param min_val Sets the minimum allowed value of the setting
     * @param max_val Sets the maximum allowed value of the setting
     * @param name Label for the setting
     * @param category_ Category of the setting AKA INI group
     * @param specialization_ Suggestion for how frontend implementations represent this in a config
     * @param save_ Suggests that this should or should not be saved to a frontend config file
     */
    explicit Setting(Linkage& linkage, const Type& default_val, const Type& min_val,
                     const Type& max_val, const std::string& name, Category category_,
                     u32 specialization_ = Specialization::Default, bool save_ = true)
        requires(ranged)
        : BasicSetting(linkage, name, category_, save_, specialization_), value{default_val},
          default_value{default_val}, maximum{max_val}, minimum{min_val} {}

    /**
     *  Returns a reference to the setting's value.
     *
     * @returns A reference to the setting
     */
    [[nodiscard]] virtual const Type& GetValue() const {
        return value;
    }

    /**
     * Sets the setting to the given value.
     *
     * @param val The desired value
     */
    virtual void SetValue(const Type& val) {
        Type temp{ranged ? std::clamp(val, minimum, maximum) : val};
        std::swap(value, temp);
    }

    /**
     * Returns the value that this setting was created with.
     *
     * @returns A reference to the default value
     */
    [[nodiscard]] const Type& GetDefault() const {
        return default_value;
    }

protected:
    [[nodiscard]] std::string ToString(const Type& value_) const {
        if constexpr (std::is_same_v<Type, std::string>) {
            return value_;
        } else if constexpr (std::is_same_v<Type, bool>) {
            return value_ ? "true" : "false";
        } else if constexpr (std::is_floating_point_v<Type>) {
            return fmt::format("{:f}", value_);
        } else {
            return std::to_string(value_);
        }
    }

public:
    /**
     * Converts the value of the setting to a std::string.
     *
     * @returns The current setting as a std::string
     */
    [[nodiscard]] std::string ToString() const override {
        return ToString(this->GetValue());
    }

    /**
     * Returns the default value of the setting as a std::string.
     *
     * @returns The default value as a string.
     */
    [[nodiscard]] std::string DefaultToString() const override {
        return ToString(default_value);
    }

    /**
     * Assigns a value to the setting.
     *
     * @param val The desired setting value
     *
     * @returns A reference to the setting
     */
    virtual const Type& operator=(const Type& val) {
        Type temp{ranged ? std::clamp(val, minimum, maximum) : val};
        std::swap(value, temp);
        return value;
    }

    /**
     * Returns a reference to the setting.
     *
     * @returns A reference to the setting
     */
    explicit virtual operator const Type&() const {
        return value;
    }

    /**
     * Converts the given value to the Setting's type of value. Uses SetValue to enter the setting,
     * thus respecting its constraints.
     *
     * @param input The desired value
     */
    void LoadString(const std::string& input) override final {
        if (input.empty()) {
            this->SetValue(this->GetDefault());
            return;
        }
        try {
            if constexpr (std::is_same_v<Type, std::string>) {
                this->SetValue(input);
            } else if constexpr (std::is_same_v<Type, bool>) {
                this->SetValue(input == "true");
            } else if constexpr (std::is_same_v<Type, float>) {
                this->SetValue(std::stof(input));
            } else {
                this->SetValue(static_cast<Type>(std::stoll(input)));
            }
        } catch (std::invalid_argument&) {
            this->SetValue(this->GetDefault());
        } catch (std::out_of_range&) {
            this->SetValue(this->GetDefault());
        }
    }

    /**
     * Gives us another way to identify the setting without having to go through a string.
     *
     * @returns the type_index of the setting's type
     */
    [[nodiscard]] std::type_index TypeId() const override final {
        return std::type_index(typeid(Type));
    }

    [[nodiscard]] constexpr bool IsIntegral() const final {
        return std::is_integral_v<Type>;
    }

    [[nodiscard]] std::string MinVal() const override final {
        if constexpr (std::is_arithmetic_v<Type> && !ranged) {
            return this->ToString(std::numeric_limits<Type>::min());
        } else {
            return this->ToString(minimum);
        }
    }
    [[nodiscard]] std::string MaxVal() const override final {
        if constexpr (std::is_arithmetic_v<Type> && !ranged) {
            return this->ToString(std::numeric_limits<Type>::max());
        } else {
            return this->ToString(maximum);
        }
    }

    [[nodiscard]] constexpr bool Ranged() const override {
        return ranged;
    }

protected:
    Type value{};               ///< The setting
    const Type default_value{}; ///< The default value
    const Type maximum{};       ///< Maximum allowed value of the setting
    const Type minimum{};       ///< Minimum allowed value of the setting
};

} // namespace Settings
