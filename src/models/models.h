#ifndef MODELS_H
#define MODELS_H

#include "moleculetemplate.h"
#include "moleculeinstance.h"
#include "atomtemplate.h"
#include "../sync/recordfactory.h"

namespace RecordSync {

/**
 * @brief Register every entity type this application syncs
 */
void registerModelTypes(RecordFactory &factory);

} // namespace RecordSync

#endif // MODELS_H
