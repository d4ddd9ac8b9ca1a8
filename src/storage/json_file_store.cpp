#include "../../include/tickguard/storage/json_file_store.hpp"
#include "../../include/tickguard/storage/json_codec.hpp"
#include "../../include/tickguard/util/time_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace tickguard::storage {

JsonFileStore::JsonFileStore(std::string path) : path_(std::move(path)) {}

bool JsonFileStore::exists() const {
    std::ifstream f(path_);
    return f.good();
}

std::string JsonFileStore::samples_path(TradeId trade_id) const {
    return samples_dir() + "/" + std::to_string(trade_id) + ".jsonl";
}

bool JsonFileStore::load() {
    std::ifstream in(path_);
    if (!in.is_open())
        return false;

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    if (content.empty())
        return false;

    State loaded;
    try {
        json doc = json::parse(content);

        for (const auto& t : doc.value("trades", json::array())) {
            auto trade = t.get<trading::Trade>();
            loaded.trades[trade.id] = trade;
            loaded.next_id = std::max(loaded.next_id, trade.id + 1);
        }
        for (const auto& m : doc.value("milestones", json::array())) {
            auto record = m.get<trading::MilestoneRecord>();
            loaded.milestones[record.trade_id] = record;
        }
        for (const auto& a : doc.value("asset_health", json::array())) {
            auto record = a.get<risk::AssetHealthRecord>();
            loaded.asset_health[record.key.to_string()] = record;
        }
        loaded.next_id = std::max(loaded.next_id, doc.value("next_id", TradeId{1}));
    } catch (const json::exception& e) {
        throw StoreError("Cannot parse store file " + path_ + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw StoreError("Invalid record in store file " + path_ + ": " + e.what());
    }

    load_samples(loaded);

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(loaded);
    appended_from_.clear();
    return true;
}

void JsonFileStore::load_samples(State& state) const {
    std::error_code ec;
    if (!fs::is_directory(samples_dir(), ec))
        return;

    for (const auto& entry : fs::directory_iterator(samples_dir(), ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".jsonl")
            continue;

        std::ifstream in(entry.path());
        if (!in.is_open())
            throw StoreError("Cannot open sample log " + entry.path().string());

        std::string line;
        size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.empty())
                continue;
            try {
                auto sample = json::parse(line).get<trading::PriceSample>();
                state.samples[sample.trade_id].push_back(sample);
            } catch (const json::exception& e) {
                throw StoreError("Cannot parse sample log " + entry.path().string() + " line " +
                                 std::to_string(line_no) + ": " + e.what());
            }
        }
    }
    if (ec)
        throw StoreError("Cannot list " + samples_dir() + ": " + ec.message());
}

void JsonFileStore::write_snapshot(const State& state) {
    json doc = json::object();
    doc["version"] = FORMAT_VERSION;
    doc["written_at"] = util::wall_clock_ns();
    doc["next_id"] = state.next_id;

    json trades = json::array();
    for (const auto& [id, trade] : state.trades)
        trades.push_back(trade);
    doc["trades"] = std::move(trades);

    json milestones = json::array();
    for (const auto& [id, record] : state.milestones)
        milestones.push_back(record);
    doc["milestones"] = std::move(milestones);

    json health = json::array();
    for (const auto& [k, record] : state.asset_health)
        health.push_back(record);
    doc["asset_health"] = std::move(health);

    // Write to temp file first, then rename (atomic on POSIX)
    std::string temp_path = path_ + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            throw StoreError("Cannot open " + temp_path + " for writing");
        }
        out << doc.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            out.close();
            std::remove(temp_path.c_str());
            throw StoreError("Write failed for " + temp_path);
        }
    }

    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        std::remove(temp_path.c_str());
        throw StoreError("Cannot rename " + temp_path + " to " + path_);
    }
}

void JsonFileStore::append_samples(const std::vector<trading::PriceSample>& samples) {
    appended_from_.clear();

    std::error_code ec;
    fs::create_directories(samples_dir(), ec);
    if (ec)
        throw StoreError("Cannot create " + samples_dir() + ": " + ec.message());

    std::map<TradeId, std::string> lines;
    for (const auto& sample : samples) {
        lines[sample.trade_id] += json(sample).dump();
        lines[sample.trade_id] += '\n';
    }

    for (const auto& [trade_id, text] : lines) {
        std::string file = samples_path(trade_id);
        uintmax_t size = fs::exists(file, ec) ? fs::file_size(file, ec) : 0;
        if (ec) {
            revert_samples();
            throw StoreError("Cannot stat " + file + ": " + ec.message());
        }
        appended_from_[trade_id] = size;

        std::ofstream out(file, std::ios::app);
        if (out.is_open()) {
            out << text;
            out.flush();
        }
        if (!out.is_open() || !out.good()) {
            revert_samples();
            throw StoreError("Append failed for " + file);
        }
    }
}

void JsonFileStore::revert_samples() noexcept {
    for (const auto& [trade_id, size] : appended_from_) {
        std::string file = samples_path(trade_id);
        std::error_code ec;
        if (size == 0)
            fs::remove(file, ec);
        else
            fs::resize_file(file, size, ec);
    }
    appended_from_.clear();
}

void JsonFileStore::erase_samples(TradeId trade_id) {
    appended_from_.erase(trade_id);
    std::error_code ec;
    fs::remove(samples_path(trade_id), ec);
    if (ec)
        throw StoreError("Cannot remove " + samples_path(trade_id) + ": " + ec.message());
}

} // namespace tickguard::storage
