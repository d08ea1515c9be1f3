#pragma once

/**
 * pastebin
 *
 * Stores text pastes under short content-derived ids and serves them back
 * by id, rendered or raw.
 */

#include <pastebin/types.hpp>
#include <pastebin/paste_id.hpp>
#include <pastebin/paste_store.hpp>
