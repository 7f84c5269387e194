#pragma once

// Command encoder umbrella header.
// Needs no device: the encoder can be built and formatted without a GPU.

#include <vkenc/encoder/command.hpp>
#include <vkenc/encoder/command_encoder.hpp>
#include <vkenc/encoder/recorder.hpp>
#include <vkenc/encoder/scheduler.hpp>
