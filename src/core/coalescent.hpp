#ifndef COALESCENT_H
#define COALESCENT_H

/** Coalescent process and the genealogies it generates. */

#include "coalescent/Partition.hpp"
#include "coalescent/Genealogy.hpp"
#include "coalescent/CoalescentProcess.hpp"

#endif /* COALESCENT_H */
