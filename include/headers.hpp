#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "audio/audio_chunk.hpp"
#include "audio/audio_source.hpp"
#include "audio/portaudio_source.hpp"
#include "audio/wav_file_source.hpp"
#include "cli/config_menu.hpp"
#include "cli/interrupt_guard.hpp"
#include "session/session_config.hpp"
#include "session/session_stats.hpp"
#include "session/transcription_session.hpp"
#include "stt/model_locator.hpp"
#include "stt/whisper_stt.hpp"

#endif
