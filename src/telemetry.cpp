#include "telemetry.hpp"
#include <iostream>

using json = nlohmann::json;

static const char* status_name(SpanStatus s) {
    switch (s) {
    case SpanStatus::ok: return "OK";
    case SpanStatus::error: return "ERROR";
    case SpanStatus::unset: break;
    }
    return "UNSET";
}

static int64_t epoch_us(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

void to_json(json& j, const SpanData& s) {
    j = json{
        {"name", s.name},
        {"startUs", epoch_us(s.start)},
        {"durationMs", s.duration_ms()},
        {"status", status_name(s.status)},
        {"attributes", s.attributes}
    };
    if (!s.status_message.empty()) j["statusMessage"] = s.status_message;
    if (!s.events.empty()) j["events"] = s.events;
}

// --------------------- sinks ---------------------

void LogSpanSink::export_span(const SpanData& span) {
    json j = span;
    std::lock_guard<std::mutex> lock(mtx_);
    std::cout << "[trace] " << j.dump() << std::endl;
}

void MemorySpanSink::export_span(const SpanData& span) {
    std::lock_guard<std::mutex> lock(mtx_);
    spans_.push_back(span);
}

std::vector<SpanData> MemorySpanSink::spans() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return spans_;
}

size_t MemorySpanSink::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return spans_.size();
}

// --------------------- Span ---------------------

Span::Span(std::string name, std::shared_ptr<SpanSink> sink) : sink_(std::move(sink)) {
    data_.name = std::move(name);
    data_.start = std::chrono::system_clock::now();
}

Span::~Span() {
    try {
        end();
    } catch (const std::exception& e) {
        std::cerr << "[trace] Failed to export span " << data_.name << ": " << e.what() << std::endl;
    }
}

void Span::set_attribute(const std::string& key, json value) {
    data_.attributes[key] = std::move(value);
}

void Span::set_attributes(const json& attrs) {
    for (auto& [k, v] : attrs.items()) data_.attributes[k] = v;
}

void Span::record_exception(const std::exception& e) {
    data_.events.push_back({
        {"name", "exception"},
        {"exception.message", e.what()},
        {"timeUs", epoch_us(std::chrono::system_clock::now())}
    });
}

void Span::set_status(SpanStatus status, std::string message) {
    data_.status = status;
    data_.status_message = std::move(message);
}

void Span::end() {
    if (ended_) return;
    ended_ = true;
    data_.end = std::chrono::system_clock::now();
    if (sink_) sink_->export_span(data_);
}

// --------------------- Tracer ---------------------

Tracer::Tracer(std::shared_ptr<SpanSink> sink)
    : sink_(sink ? std::move(sink) : std::make_shared<LogSpanSink>()) {}

std::unique_ptr<Span> Tracer::start_span(const std::string& name, const json& attributes) {
    auto span = std::make_unique<Span>(name, sink_);
    span->set_attributes(attributes);
    return span;
}
