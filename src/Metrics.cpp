/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "Metrics.h"
#include <fmt/format.h>
#include <mutex>
#include <numeric>

namespace flowvisor {

std::string Metric::escape_label_value(const std::string &value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (auto c : value) {
        switch (c) {
        case '\\':
            escaped.append("\\\\");
            break;
        case '"':
            escaped.append("\\\"");
            break;
        case '\n':
            escaped.append("\\n");
            break;
        default:
            escaped.push_back(c);
        }
    }
    return escaped;
}

void Metric::name_json_assign(json &j, const json &val) const
{
    json *j_part = &j;
    for (const auto &s_part : _name) {
        j_part = &(*j_part)[s_part];
    }
    (*j_part) = val;
}

std::string Metric::base_name_snake() const
{
    auto snake = [](const std::string &ss, const std::string &s) {
        return ss.empty() ? s : ss + "_" + s;
    };
    std::string name_text = _schema_key + "_" + std::accumulate(std::begin(_name), std::end(_name), std::string(), snake);
    return name_text;
}

std::string Metric::name_snake(const LabelMap &series_labels, const LabelMap &add_labels) const
{
    std::string label_text{"{"};
    for (const auto &[key, value] : add_labels) {
        label_text.append(key + "=\"" + escape_label_value(value) + "\",");
    }
    for (const auto &[key, value] : series_labels) {
        if (add_labels.count(key)) {
            continue;
        }
        label_text.append(key + "=\"" + escape_label_value(value) + "\",");
    }
    if (label_text.back() == ',') {
        label_text.pop_back();
    }
    label_text.push_back('}');
    if (label_text == "{}") {
        return base_name_snake();
    }
    return base_name_snake() + label_text;
}

void Metric::_prometheus_header(std::stringstream &out) const
{
    out << "# HELP " << base_name_snake() << ' ' << _desc << '\n';
    out << "# TYPE " << base_name_snake() << " counter" << '\n';
}

void Counter::to_json(json &j) const
{
    name_json_assign(j, value());
}

void Counter::to_prometheus(std::stringstream &out, const Metric::LabelMap &add_labels) const
{
    _prometheus_header(out);
    out << name_snake({}, add_labels) << ' ' << value() << '\n';
}

CounterFamily::CounterFamily(std::string schema_key, std::initializer_list<std::string> names, std::string desc, std::vector<std::string> label_names)
    : Metric(std::move(schema_key), names, std::move(desc))
    , _label_names(std::move(label_names))
{
    for (const auto &label : _label_names) {
        if (!std::regex_match(label, std::regex(LABEL_REGEX))) {
            throw std::runtime_error("invalid label name: " + label);
        }
    }
}

CounterFamily::LabelMap CounterFamily::_labels_for(const LabelValues &values) const
{
    LabelMap labels;
    for (size_t i = 0; i < _label_names.size(); ++i) {
        labels[_label_names[i]] = values[i];
    }
    return labels;
}

void CounterFamily::add(const LabelValues &values, uint64_t amount)
{
    if (values.size() != _label_names.size()) {
        throw std::invalid_argument(fmt::format("{}: expected {} label values, got {}", base_name_snake(), _label_names.size(), values.size()));
    }

    {
        std::shared_lock lock(_series_mutex);
        auto it = _series.find(values);
        if (it != _series.end()) {
            it->second->fetch_add(amount, std::memory_order_relaxed);
            return;
        }
    }

    std::unique_lock lock(_series_mutex);
    // another writer may have created the series between the two locks
    auto &series = _series[values];
    if (!series) {
        series = std::make_unique<std::atomic<uint64_t>>(0);
    }
    series->fetch_add(amount, std::memory_order_relaxed);
}

std::optional<uint64_t> CounterFamily::value(const LabelValues &values) const
{
    std::shared_lock lock(_series_mutex);
    auto it = _series.find(values);
    if (it == _series.end()) {
        return std::nullopt;
    }
    return it->second->load(std::memory_order_relaxed);
}

uint64_t CounterFamily::total() const
{
    std::shared_lock lock(_series_mutex);
    uint64_t sum{0};
    for (const auto &[labels, series] : _series) {
        sum += series->load(std::memory_order_relaxed);
    }
    return sum;
}

size_t CounterFamily::series_count() const
{
    std::shared_lock lock(_series_mutex);
    return _series.size();
}

void CounterFamily::to_json(json &j) const
{
    json series_list = json::array();
    std::shared_lock lock(_series_mutex);
    for (const auto &[values, series] : _series) {
        json entry;
        for (size_t i = 0; i < _label_names.size(); ++i) {
            entry["labels"][_label_names[i]] = values[i];
        }
        entry["value"] = series->load(std::memory_order_relaxed);
        series_list.push_back(std::move(entry));
    }
    name_json_assign(j, series_list);
}

void CounterFamily::to_prometheus(std::stringstream &out, const Metric::LabelMap &add_labels) const
{
    _prometheus_header(out);
    std::shared_lock lock(_series_mutex);
    for (const auto &[values, series] : _series) {
        out << name_snake(_labels_for(values), add_labels) << ' ' << series->load(std::memory_order_relaxed) << '\n';
    }
}

}
