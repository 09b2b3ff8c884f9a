/**
 * @file bgp.h
 * @author Nato Morichika <nat@nat.moe>
 * @brief The BGP speaker library.
 * @version 0.3
 * @date 2019-08-10
 *
 * @copyright Copyright (c) 2019
 *
 */
#ifndef BGPD_H_
#define BGPD_H_
#include "bgp-message.h"
#include "bgp-packet.h"
#include "bgp-sink.h"
#include "bgp-open-message.h"
#include "bgp-update-message.h"
#include "bgp-keepalive-message.h"
#include "bgp-notification-message.h"
#include "bgp-route-refresh-message.h"
#include "bgp-path-attrib.h"
#include "bgp-attrib-set.h"
#include "bgp-errcode.h"
#include "bgp-config.h"
#include "bgp-config-loader.h"
#include "bgp-fsm.h"
#include "bgp-peer.h"
#include "bgp-rib.h"
#include "bgp-query.h"
#include "bgp-server.h"
#include "tcp-out-handler.h"
#include "clock.h"
#endif // BGPD_H_
