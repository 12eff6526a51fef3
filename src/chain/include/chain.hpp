#pragma once

#include "abi.hpp"
#include "address.hpp"
#include "chain_error.hpp"
#include "chain_interface.hpp"
#include "rlp.hpp"
#include "transaction.hpp"
