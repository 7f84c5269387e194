#pragma once

// Umbrella header: device layer plus the command encoder.

#include <vkenc/allocator.hpp>
#include <vkenc/buffer.hpp>
#include <vkenc/capabilities.hpp>
#include <vkenc/command_pool.hpp>
#include <vkenc/device.hpp>
#include <vkenc/encoder.hpp>
#include <vkenc/error.hpp>
#include <vkenc/fence.hpp>
#include <vkenc/instance.hpp>
#include <vkenc/query_pool.hpp>
#include <vkenc/resource.hpp>
#include <vkenc/result.hpp>
#include <vkenc/texture.hpp>
