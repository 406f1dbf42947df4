#pragma once

#include "priv/common.hpp"

#include "priv/timing/TempoMap.hpp"
#include "priv/model/Arrangement.hpp"

#include "priv/processor/ProcessorMetadata.hpp"
#include "priv/processor/AudioProcessor.hpp"
#include "priv/processor/ProcessorRegistry.hpp"
#include "priv/processor/BuiltinProcessors.hpp"

#include "priv/sequencer/NoteScheduler.hpp"
#include "priv/voice/LiveVoice.hpp"
#include "priv/voice/VoiceEngine.hpp"
#include "priv/mixer/TrackMixer.hpp"

#include "priv/input/InputEvents.hpp"
#include "priv/input/LiveInputRouter.hpp"
#include "priv/input/UmpInputDecoder.hpp"

#include "priv/engine/EngineConfiguration.hpp"
#include "priv/engine/RenderEngine.hpp"

#include "priv/project/ProjectWireFormat.hpp"
