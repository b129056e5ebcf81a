#ifndef FRAGLOADER_FRAGMENT_HPP
#define FRAGLOADER_FRAGMENT_HPP

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fragloader/export.hpp>

namespace fragloader
{
    // Where to fetch one fragment from.
    struct FragmentLocator
    {
        std::string url;
        // "Key: Value" headers sent with this fragment only, on top of (and overriding)
        // the context-wide ones.
        std::vector<std::string> headers;
    };

    // A stream whose fragment count is known up front.
    struct FiniteSession
    {
        std::size_t total_fragments = 0;
    };

    // A stream that keeps growing until its source runs dry or the download is stopped.
    struct LiveSession
    {
    };

    using SessionKind = std::variant<FiniteSession, LiveSession>;

    inline bool is_live(const SessionKind& kind) noexcept
    {
        return std::holds_alternative<LiveSession>(kind);
    }

    // Total fragment count, none for live sessions.
    inline std::optional<std::size_t> fragment_count(const SessionKind& kind) noexcept
    {
        if (const auto* finite = std::get_if<FiniteSession>(&kind))
            return finite->total_fragments;
        return std::nullopt;
    }

    // Ordered source of fragments handed over by the manifest layer.
    class FRAGLOADER_API FragmentSequence
    {
    public:
        virtual ~FragmentSequence() = default;

        virtual SessionKind kind() const = 0;

        // Locator of fragment `index`, none once the sequence is exhausted.
        virtual std::optional<FragmentLocator> at(std::size_t index) = 0;
    };

    class FRAGLOADER_API FragmentList : public FragmentSequence
    {
    public:
        FragmentList() = default;
        explicit FragmentList(std::vector<FragmentLocator> fragments);

        // Convenience for url-only fragments.
        static FragmentList from_urls(const std::vector<std::string>& urls);

        SessionKind kind() const override;
        std::optional<FragmentLocator> at(std::size_t index) override;

        void push_back(FragmentLocator locator);
        std::size_t size() const noexcept
        {
            return m_fragments.size();
        }

    private:
        std::vector<FragmentLocator> m_fragments;
    };

    class FRAGLOADER_API LiveFragmentSequence : public FragmentSequence
    {
    public:
        // Called with increasing indices. Returning none ends the stream.
        using generator_t = std::function<std::optional<FragmentLocator>(std::size_t)>;

        explicit LiveFragmentSequence(generator_t generator);

        SessionKind kind() const override;
        std::optional<FragmentLocator> at(std::size_t index) override;

    private:
        generator_t m_generator;
    };
}

#endif
