/**
 * @file Tracer.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Trace loop implementation
 * @version 0.1
 * @date 2026-03-09
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Trace/Tracer.h"
#include "Utils/Logging.h"

using namespace simtrace;

Tracer::Tracer(IApduSource& source,
               const ApduDecoder& decoder,
               RuntimeState& state,
               ITraceSink& sink,
               const TracerOptions& options)
    : source(source)
    , decoder(decoder)
    , runtime(state)
    , sink(sink)
    , options(options)
    , state(State::Running)
{
}

etl::expected<void, error::Error> Tracer::run()
{
    LOG_INFO("Tracing from %.*s", static_cast<int>(source.name().size()), source.name().data());

    while (state == State::Running)
    {
        auto stepped = step();
        if (!stepped)
        {
            return stepped;
        }
    }

    LOG_INFO("End of trace: %u exchanges, %u resets, %u records, %u suppressed, %u unrecognized, %u degraded",
             static_cast<unsigned>(stats.exchanges),
             static_cast<unsigned>(stats.resets),
             static_cast<unsigned>(stats.emitted),
             static_cast<unsigned>(stats.suppressed),
             static_cast<unsigned>(stats.unrecognized),
             static_cast<unsigned>(stats.degraded));
    return {};
}

etl::expected<void, error::Error> Tracer::step()
{
    if (state == State::Terminated)
    {
        return {};
    }

    auto event = source.readNext();
    if (!event)
    {
        LOG_ERROR("Source %.*s failed: %s",
                  static_cast<int>(source.name().size()), source.name().data(),
                  event.error().toString().c_str());
        state = State::Terminated;
        return etl::unexpected(event.error());
    }

    const SourceEvent& current = event.value();
    if (etl::holds_alternative<CardReset>(current))
    {
        handleReset();
    }
    else if (etl::holds_alternative<EndOfStream>(current))
    {
        handleEndOfStream();
    }
    else
    {
        handleExchange(etl::get<ApduExchange>(current));
    }

    return {};
}

void Tracer::handleReset()
{
    if (combiner.hasPending())
    {
        LOG_WARN("Card reset while waiting for GET RESPONSE, dropping pending exchange");
    }
    combiner.discard();
    runtime.reset();
    ++stats.resets;
    LOG_DEBUG("Card reset");
}

void Tracer::handleEndOfStream()
{
    TpduCombiner::Output released;
    combiner.flush(released);
    for (size_t i = 0; i < released.size(); ++i)
    {
        processExchange(released[i]);
    }
    state = State::Terminated;
}

void Tracer::handleExchange(const ApduExchange& exchange)
{
    if (!options.combineGetResponse)
    {
        processExchange(exchange);
        return;
    }

    TpduCombiner::Output released;
    combiner.push(exchange, released);
    for (size_t i = 0; i < released.size(); ++i)
    {
        processExchange(released[i]);
    }
}

void Tracer::processExchange(const ApduExchange& exchange)
{
    ++stats.exchanges;

    std::unique_ptr<ApduCommand> command = decoder.decode(exchange);
    command->process(runtime);

    if (command->kind() == CommandKind::Unrecognized)
    {
        ++stats.unrecognized;
    }
    if (command->isDegraded())
    {
        ++stats.degraded;
    }

    if (isSuppressed(*command))
    {
        ++stats.suppressed;
        return;
    }

    sink.emit(*command);
    ++stats.emitted;
}

bool Tracer::isSuppressed(const ApduCommand& command) const
{
    switch (command.kind())
    {
        case CommandKind::Select:
            return options.suppressSelect;
        case CommandKind::Status:
            return options.suppressStatus;
        default:
            return false;
    }
}
