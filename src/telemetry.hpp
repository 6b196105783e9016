#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class SpanStatus { unset, ok, error };

struct SpanData {
    std::string name;
    nlohmann::json attributes = nlohmann::json::object();
    std::vector<nlohmann::json> events;     // recorded exceptions
    SpanStatus status = SpanStatus::unset;
    std::string status_message;
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;

    double duration_ms() const {
        return std::chrono::duration<double, std::milli>(end - start).count();
    }
};

void to_json(nlohmann::json& j, const SpanData& s);

class SpanSink {
public:
    virtual ~SpanSink() = default;
    virtual void export_span(const SpanData& span) = 0;
};

// Writes each finished span as one "[trace] {...}" line on stdout.
class LogSpanSink : public SpanSink {
public:
    void export_span(const SpanData& span) override;

private:
    std::mutex mtx_;
};

class MemorySpanSink : public SpanSink {
public:
    void export_span(const SpanData& span) override;
    std::vector<SpanData> spans() const;
    size_t size() const;

private:
    mutable std::mutex mtx_;
    std::vector<SpanData> spans_;
};

// A span is exported exactly once: on the first end(), or on destruction
// when nobody ended it.
class Span {
public:
    Span(std::string name, std::shared_ptr<SpanSink> sink);
    ~Span();

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    void set_attribute(const std::string& key, nlohmann::json value);
    void set_attributes(const nlohmann::json& attrs);
    void record_exception(const std::exception& e);
    void set_status(SpanStatus status, std::string message = "");
    void end();

    bool ended() const { return ended_; }
    const SpanData& data() const { return data_; }

private:
    SpanData data_;
    std::shared_ptr<SpanSink> sink_;
    bool ended_ = false;
};

class Tracer {
public:
    explicit Tracer(std::shared_ptr<SpanSink> sink = nullptr);

    std::unique_ptr<Span> start_span(const std::string& name, const nlohmann::json& attributes = nlohmann::json::object());

private:
    std::shared_ptr<SpanSink> sink_;
};
