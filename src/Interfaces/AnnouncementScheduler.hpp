//----------------------------------------------------------------------------------------------------------------------
// File: AnnouncementScheduler.hpp
// Description: Defines an interface that allows the registry to start and stop the periodic broadcasting of the
// services registered by this node.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Scheduler/Tasks.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class IAnnouncementScheduler
{
public:
    virtual ~IAnnouncementScheduler() = default;

    [[nodiscard]] virtual std::optional<Scheduler::TaskIdentifier> ScheduleAnnouncements(
        std::string const& name, std::chrono::milliseconds interval) = 0;
    virtual bool CancelAnnouncements(Scheduler::TaskIdentifier const& identifier) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
