/**
 * @file itransferclient.cpp
 * @brief Implementation file for the TransferHandle and ITransferClient interfaces.
 *
 * This file exists to support Qt's MOC (Meta-Object Compiler) which requires
 * a .cpp file to generate signal/slot infrastructure for the interfaces.
 */

#include "itransferclient.h"
