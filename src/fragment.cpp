#include <stdexcept>

#include <fragloader/fragment.hpp>

namespace fragloader
{
    FragmentList::FragmentList(std::vector<FragmentLocator> fragments)
        : m_fragments(std::move(fragments))
    {
    }

    FragmentList FragmentList::from_urls(const std::vector<std::string>& urls)
    {
        std::vector<FragmentLocator> fragments;
        fragments.reserve(urls.size());
        for (const auto& url : urls)
        {
            fragments.push_back(FragmentLocator{ url, {} });
        }
        return FragmentList(std::move(fragments));
    }

    SessionKind FragmentList::kind() const
    {
        return FiniteSession{ m_fragments.size() };
    }

    std::optional<FragmentLocator> FragmentList::at(std::size_t index)
    {
        if (index >= m_fragments.size())
            return std::nullopt;
        return m_fragments[index];
    }

    void FragmentList::push_back(FragmentLocator locator)
    {
        m_fragments.push_back(std::move(locator));
    }

    LiveFragmentSequence::LiveFragmentSequence(generator_t generator)
        : m_generator(std::move(generator))
    {
        if (!m_generator)
            throw std::invalid_argument("live fragment sequence needs a generator");
    }

    SessionKind LiveFragmentSequence::kind() const
    {
        return LiveSession{};
    }

    std::optional<FragmentLocator> LiveFragmentSequence::at(std::size_t index)
    {
        return m_generator(index);
    }
}
