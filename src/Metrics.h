/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <vector>

namespace flowvisor {

using json = nlohmann::json;

class Metric
{
public:
    typedef std::map<std::string, std::string> LabelMap;

protected:
    std::vector<std::string> _name;
    std::string _desc;
    std::string _schema_key;

    void _check_names()
    {
        for (const auto &name : _name) {
            if (!std::regex_match(name, std::regex(LABEL_REGEX))) {
                throw std::runtime_error("invalid metric name: " + name);
            }
        }
        if (!std::regex_match(_schema_key, std::regex(LABEL_REGEX))) {
            throw std::runtime_error("invalid schema name: " + _schema_key);
        }
    }

    void _prometheus_header(std::stringstream &out) const;

public:
    inline static const std::string LABEL_REGEX = "[a-zA-Z_][a-zA-Z0-9_]*";

    Metric(std::string schema_key, std::initializer_list<std::string> names, std::string desc)
        : _name(names)
        , _desc(std::move(desc))
        , _schema_key(std::move(schema_key))
    {
        _check_names();
    }

    virtual ~Metric() = default;

    /**
     * escape a label value for the prometheus text exposition format
     */
    static std::string escape_label_value(const std::string &value);

    void name_json_assign(json &j, const json &val) const;

    [[nodiscard]] std::string base_name_snake() const;
    /**
     * the series name with its labels; add_labels (for example the scrape "instance") come first
     */
    [[nodiscard]] std::string name_snake(const LabelMap &series_labels, const LabelMap &add_labels = {}) const;

    virtual void to_json(json &j) const = 0;
    virtual void to_prometheus(std::stringstream &out, const LabelMap &add_labels = {}) const = 0;
};

/**
 * A monotonic Counter metric. Increments are atomic; safe to read while another thread writes.
 */
class Counter final : public Metric
{
    std::atomic<uint64_t> _value{0};

public:
    Counter(std::string schema_key, std::initializer_list<std::string> names, std::string desc)
        : Metric(std::move(schema_key), names, std::move(desc))
    {
    }

    Counter &operator++()
    {
        _value.fetch_add(1, std::memory_order_relaxed);
        return *this;
    }

    void operator+=(uint64_t i)
    {
        _value.fetch_add(i, std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t value() const
    {
        return _value.load(std::memory_order_relaxed);
    }

    // Metric
    void to_json(json &j) const override;
    void to_prometheus(std::stringstream &out, const LabelMap &add_labels = {}) const override;
};

/**
 * A family of monotonic counters sharing a name, one series per distinct tuple of label values.
 *
 * Series are created on first use and never removed. Existing series are incremented under a shared lock,
 * so readers and writers of existing series never block each other; only the first increment of a new
 * tuple takes the exclusive lock.
 */
class CounterFamily final : public Metric
{
public:
    typedef std::vector<std::string> LabelValues;

private:
    std::vector<std::string> _label_names;
    mutable std::shared_mutex _series_mutex;
    std::map<LabelValues, std::unique_ptr<std::atomic<uint64_t>>> _series;

    LabelMap _labels_for(const LabelValues &values) const;

public:
    CounterFamily(std::string schema_key, std::initializer_list<std::string> names, std::string desc, std::vector<std::string> label_names);

    /**
     * @throws std::invalid_argument if the number of values does not match the label names
     */
    void add(const LabelValues &values, uint64_t amount);

    [[nodiscard]] std::optional<uint64_t> value(const LabelValues &values) const;
    [[nodiscard]] uint64_t total() const;
    [[nodiscard]] size_t series_count() const;

    // Metric
    void to_json(json &j) const override;
    void to_prometheus(std::stringstream &out, const LabelMap &add_labels = {}) const override;
};

}
