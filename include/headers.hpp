#ifndef HEADERS_HPP
#define HEADERS_HPP

#include "app/assistant.hpp"
#include "audio/command_recorder.hpp"
#include "audio/feedback_player.hpp"
#include "audio/fvad_detector.hpp"
#include "audio/microphone.hpp"
#include "audio/recording_session.hpp"
#include "config/app_config.hpp"
#include "config/configuration_error.hpp"
#include "net/service_client.hpp"
#include "stt/whisper_stt.hpp"
#include "wake/porcupine_wake_word.hpp"
#include "wake/wake_word.hpp"

#endif
