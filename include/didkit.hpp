#pragma once

/// didkit - DID Documents and the patch engine that mutates them
/// Following W3C DID Core v1.0

#include "didkit/common/error.hpp"
#include "didkit/common/flexvec.hpp"
#include "didkit/document/context.hpp"
#include "didkit/document/did_document.hpp"
#include "didkit/document/json.hpp"
#include "didkit/document/relationship.hpp"
#include "didkit/document/service.hpp"
#include "didkit/document/verification_method.hpp"
#include "didkit/patch/builder.hpp"
#include "didkit/patch/patch.hpp"
#include "didkit/patch/relationship_set.hpp"
#include "didkit/registrar/key.hpp"
#include "didkit/registrar/registrar.hpp"
