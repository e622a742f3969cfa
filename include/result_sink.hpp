// ===================== include/result_sink.hpp =====================
#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netprobe
{
    using Labels = std::vector<std::pair<std::string, std::string>>;

    enum class SampleKind
    {
        Gauge,
        Counter
    };

    struct Sample
    {
        std::string name;
        Labels labels;
        double value{};
    };

    /**
     * Named numeric samples produced by one probe invocation. The caller
     * creates a fresh sink per invocation and owns it; probers only write.
     */
    class ResultSink
    {
    public:
        void describe(const std::string &name, const std::string &help,
                      SampleKind kind = SampleKind::Gauge);

        void set(const std::string &name, double value, const Labels &labels = {});
        void add(const std::string &name, double delta, const Labels &labels = {});

        // Reader side, used by the caller once the probe returned.
        std::optional<double> value(const std::string &name, const Labels &labels = {}) const;
        std::vector<Sample> family(const std::string &name) const;
        std::vector<Sample> samples() const;
        std::string help(const std::string &name) const;
        SampleKind kind(const std::string &name) const;

    private:
        struct Family
        {
            std::string help;
            SampleKind kind = SampleKind::Gauge;
            std::map<Labels, double> values;
        };
        std::map<std::string, Family> families_;
    };
} // namespace netprobe
