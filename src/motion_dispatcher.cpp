#include "motion_dispatcher.h"
#include "logger.h"

MotionDispatcher::MotionDispatcher(StepperAxis& azimuth, MotionQueue& azimuthQueue,
                                   StepperAxis& elevation, MotionQueue& elevationQueue,
                                   MotionClock& clock, HomingLauncher& launcher,
                                   uint32_t resetSettleMs)
    : azimuthLane(azimuth, azimuthQueue),
      elevationLane(elevation, elevationQueue),
      clock(clock),
      launcher(launcher),
      resetSettleMs(resetSettleMs),
      homingGeneration(0),
      homingSequences(0) {}

MotionDispatcher::Lane& MotionDispatcher::lane(AxisId axis) {
    return axis == AxisId::Azimuth ? azimuthLane : elevationLane;
}

const MotionDispatcher::Lane& MotionDispatcher::lane(AxisId axis) const {
    return axis == AxisId::Azimuth ? azimuthLane : elevationLane;
}

bool MotionDispatcher::enqueue(Lane& l, const MotionRequest& request, uint32_t& ticket) {
    std::lock_guard<std::mutex> lock(l.enqueueMutex);
    MotionRequest queued = request;
    queued.ticket = l.nextTicket++;
    queued.stopToken = l.axis.stopToken();
    ticket = queued.ticket;
    return l.queue.push(queued);
}

// -----------------------------------------------------------------------------
// Requests
// -----------------------------------------------------------------------------

bool MotionDispatcher::requestMove(AxisId axis, float targetDeg, MotionSource source) {
    Lane& l = lane(axis);

    // A new client target replaces moves that have not started yet.
    // Homing keeps its queue intact.
    if (source == MotionSource::Command && homingSequences.load() == 0) {
        l.queue.clear();
    }

    MotionRequest request;
    request.kind = RequestKind::Move;
    request.targetDeg = targetDeg;
    request.source = source;
    uint32_t ticket = 0;
    return enqueue(l, request, ticket);
}

bool MotionDispatcher::requestHomeAll(bool stopFirst) {
    if (stopFirst) {
        LOG_INFO("Resetting system...");
        stopAll();
    }

    uint32_t generation = (homingGeneration.fetch_add(1) + 1) & HOMING_GENERATION_MASK;
    homingSequences++;
    if (!launcher.launch(generation, stopFirst)) {
        homingSequences--;
        LOG_ERROR("Homing sequence could not be started");
        return false;
    }
    return true;
}

void MotionDispatcher::stopAll() {
    homingGeneration++;
    azimuthLane.queue.clear();
    elevationLane.queue.clear();
    azimuthLane.axis.stop();
    elevationLane.axis.stop();
}

AxisStatus MotionDispatcher::status(AxisId axis) const {
    return lane(axis).axis.status();
}

bool MotionDispatcher::isBusy(AxisId axis) const {
    const Lane& l = lane(axis);
    return l.active.load() || homingSequences.load() > 0 || l.queue.pending() > 0;
}

// -----------------------------------------------------------------------------
// Worker
// -----------------------------------------------------------------------------

MoveResult MotionDispatcher::execute(AxisId axis, const MotionRequest& request) {
    Lane& l = lane(axis);
    StepperAxis& stepper = l.axis;

    l.active = true;
    MoveResult result;
    if (request.kind == RequestKind::Home) {
        result = stepper.home(request.stopToken);
    } else {
        float speed = (request.source == MotionSource::Correction)
            ? stepper.getConfig().correctionSpeed
            : stepper.getConfig().defaultSpeed;
        result = stepper.moveTo(request.targetDeg, speed, request.stopToken);
    }
    l.active = false;

    {
        std::lock_guard<std::mutex> lock(l.completionMutex);
        l.completedTicket = request.ticket;
        l.completedResult = result;
    }

    if (!isMoveSuccess(result)) {
        LOG_WARNF("%s: move to %.2f failed (%s)", stepper.name(), request.targetDeg, moveResultName(result));
    }
    return result;
}

// -----------------------------------------------------------------------------
// Homing sequence
// -----------------------------------------------------------------------------

bool MotionDispatcher::homingCurrent(uint32_t generation) const {
    return generation == (homingGeneration.load() & HOMING_GENERATION_MASK);
}

bool MotionDispatcher::homeAndWait(Lane& l, uint32_t generation) {
    if (!homingCurrent(generation)) {
        return false;
    }

    MotionRequest request;
    request.kind = RequestKind::Home;
    uint32_t ticket = 0;
    if (!enqueue(l, request, ticket)) {
        LOG_WARNF("%s: home request not queued", l.axis.name());
        return false;
    }

    for (;;) {
        {
            std::lock_guard<std::mutex> lock(l.completionMutex);
            if (l.completedTicket == ticket) {
                return l.completedResult == MoveResult::Completed;
            }
            // A later ticket finished first: ours was flushed
            if ((int32_t)(l.completedTicket - ticket) > 0) {
                return false;
            }
        }
        if (!homingCurrent(generation)) {
            return false;
        }
        clock.sleepMicros((uint64_t)HOMING_POLL_MS * 1000);
    }
}

bool MotionDispatcher::runHoming(uint32_t generation, bool stopFirst) {
    if (stopFirst) {
        clock.sleepMicros((uint64_t)resetSettleMs * 1000);
    }

    bool ok = false;
    if (homingCurrent(generation)) {
        LOG_INFO("Homing all axes...");
        // Elevation first so the dish is parked before azimuth swings
        ok = homeAndWait(elevationLane, generation) && homeAndWait(azimuthLane, generation);
        if (ok) {
            LOG_INFO("Homing complete");
        } else {
            LOG_WARN("Homing aborted");
        }
    } else {
        LOG_DEBUG("Homing superseded before it started");
    }

    homingSequences--;
    return ok;
}
