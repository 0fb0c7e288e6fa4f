/**
 * @file multichannel.hpp
 * @brief Umbrella header: priority + weighted-random + freezable
 *        multi-producer multi-consumer channels.
 */

#ifndef MCH_MULTICHANNEL_HPP_
#define MCH_MULTICHANNEL_HPP_

#include "mch/platform.hpp"
#include "mch/vocabulary.hpp"
#include "mch/log.hpp"
#include "mch/config.hpp"
#include "mch/cancel_token.hpp"
#include "mch/channel.hpp"
#include "mch/weighted_select.hpp"
#include "mch/registry.hpp"
#include "mch/sender.hpp"
#include "mch/receiver.hpp"
#include "mch/builder.hpp"

#endif  // MCH_MULTICHANNEL_HPP_
