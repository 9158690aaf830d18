#ifndef _PTYRECON_H
#define _PTYRECON_H

#include <common/communicator.hpp>
#include <common/complex.hpp>
#include <common/logger.hpp>
#include <common/reducer.hpp>
#include <common/types.hpp>
#include <common/utils.hpp>

#include <ptycho/divided.hpp>
#include <ptycho/engines_common.hpp>
#include <ptycho/objective.hpp>
#include <ptycho/opt.hpp>
#include <ptycho/options.hpp>
#include <ptycho/patch.hpp>
#include <ptycho/probe.hpp>
#include <ptycho/propagator.hpp>
#include <ptycho/ptycho.hpp>

/** @file */

#endif  // _PTYRECON_H
