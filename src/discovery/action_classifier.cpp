#include "discovery/action_classifier.hpp"

#include <algorithm>
#include <cstdint>

#include "core/strings.hpp"

namespace composedeck::discovery
{

    namespace
    {

        using StateMask = std::uint8_t;

        constexpr StateMask bit(ProjectState state)
        {
            return static_cast<StateMask>(1U << static_cast<unsigned>(state));
        }

        constexpr StateMask kActive = bit(ProjectState::Running) | bit(ProjectState::Degraded);
        constexpr StateMask kHasContainers =
            kActive | bit(ProjectState::Stopped) | bit(ProjectState::Paused) | bit(ProjectState::Unknown);
        constexpr StateMask kAnyState = kHasContainers | bit(ProjectState::NotStarted);

        struct ActionRule
        {
            const char *action;
            bool needsFile;
            StateMask states;
        };

        // One row per action key, in vocabulary order.
        constexpr std::array<ActionRule, 17> kRules = {{
            {"up", true, kAnyState},
            {"create", true, bit(ProjectState::NotStarted)},
            {"build", true, kAnyState},
            {"pull", true, kAnyState},
            {"push", true, kAnyState},
            {"config", true, kAnyState},
            {"start", false, bit(ProjectState::Stopped)},
            {"stop", false, kActive},
            {"restart", false, kActive | bit(ProjectState::Stopped) | bit(ProjectState::Paused)},
            {"pause", false, kActive},
            {"unpause", false, bit(ProjectState::Paused)},
            {"ps", false, kHasContainers},
            {"logs", false, kHasContainers},
            {"top", false, kHasContainers},
            {"down", false, kHasContainers},
            {"rm", false, bit(ProjectState::Stopped)},
            {"kill", false, kHasContainers},
        }};

        template <std::size_t N>
        bool containsIgnoreCase(const std::array<const char *, N> &set, const std::string &command)
        {
            const std::string needle = lower(trim(command));
            return std::any_of(set.begin(), set.end(), [&](const char *item)
                               { return needle == item; });
        }

    } // namespace

    ProjectState normalizeState(const std::optional<std::string> &state)
    {
        if (!state.has_value())
        {
            return ProjectState::NotStarted;
        }
        const std::string value = lower(trim(state.value()));
        if (value.empty() || value == kNotStartedState || value == "down")
        {
            return ProjectState::NotStarted;
        }
        if (value == "running")
        {
            return ProjectState::Running;
        }
        if (value == "degraded")
        {
            return ProjectState::Degraded;
        }
        if (value == "stopped" || value == "exited")
        {
            return ProjectState::Stopped;
        }
        if (value == "paused")
        {
            return ProjectState::Paused;
        }
        return ProjectState::Unknown;
    }

    const char *stateName(ProjectState state)
    {
        switch (state)
        {
        case ProjectState::Running:
            return "running";
        case ProjectState::Degraded:
            return "degraded";
        case ProjectState::Stopped:
            return "stopped";
        case ProjectState::Paused:
            return "paused";
        case ProjectState::NotStarted:
            return kNotStartedState;
        case ProjectState::Unknown:
            break;
        }
        return "unknown";
    }

    model::ActionMap computeActions(bool hasFile, const std::optional<std::string> &state)
    {
        const StateMask current = bit(normalizeState(state));

        model::ActionMap actions;
        for (const auto &rule : kRules)
        {
            const bool fileOk = !rule.needsFile || hasFile;
            actions[rule.action] = fileOk && (rule.states & current) != 0;
        }
        return actions;
    }

    bool requiresDefinitionFile(const std::string &command)
    {
        return containsIgnoreCase(kRequiresDefinitionFile, command);
    }

    bool worksWithoutFile(const std::string &command)
    {
        return containsIgnoreCase(kWorksWithoutFile, command);
    }

    std::string deriveProjectState(const std::vector<model::ServiceInfo> &services)
    {
        if (services.empty())
        {
            return kNotStartedState;
        }

        std::size_t running = 0;
        std::size_t paused = 0;
        for (const auto &service : services)
        {
            const std::string state = lower(trim(service.state));
            if (state == "running")
            {
                ++running;
            }
            else if (state == "paused")
            {
                ++paused;
            }
        }

        if (running == services.size())
        {
            return "running";
        }
        if (running > 0)
        {
            return "degraded";
        }
        if (paused == services.size())
        {
            return "paused";
        }
        return "stopped";
    }

} // namespace composedeck::discovery
