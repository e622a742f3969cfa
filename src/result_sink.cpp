// ===================== src/result_sink.cpp =====================
#include "result_sink.hpp"

namespace netprobe
{
    void ResultSink::describe(const std::string &name, const std::string &help, SampleKind kind)
    {
        auto &f = families_[name];
        f.help = help;
        f.kind = kind;
    }

    void ResultSink::set(const std::string &name, double value, const Labels &labels)
    {
        families_[name].values[labels] = value;
    }

    void ResultSink::add(const std::string &name, double delta, const Labels &labels)
    {
        families_[name].values[labels] += delta;
    }

    std::optional<double> ResultSink::value(const std::string &name, const Labels &labels) const
    {
        auto f = families_.find(name);
        if (f == families_.end())
            return std::nullopt;
        auto v = f->second.values.find(labels);
        if (v == f->second.values.end())
            return std::nullopt;
        return v->second;
    }

    std::vector<Sample> ResultSink::family(const std::string &name) const
    {
        std::vector<Sample> out;
        auto f = families_.find(name);
        if (f == families_.end())
            return out;
        for (const auto &kv : f->second.values)
            out.push_back(Sample{name, kv.first, kv.second});
        return out;
    }

    std::vector<Sample> ResultSink::samples() const
    {
        std::vector<Sample> out;
        for (const auto &f : families_)
            for (const auto &kv : f.second.values)
                out.push_back(Sample{f.first, kv.first, kv.second});
        return out;
    }

    std::string ResultSink::help(const std::string &name) const
    {
        auto f = families_.find(name);
        return f == families_.end() ? std::string() : f->second.help;
    }

    SampleKind ResultSink::kind(const std::string &name) const
    {
        auto f = families_.find(name);
        return f == families_.end() ? SampleKind::Gauge : f->second.kind;
    }
} // namespace netprobe
