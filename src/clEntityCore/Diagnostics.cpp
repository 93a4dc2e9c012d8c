
//
// ===============================================================================
// clEntity
// -------------------------------------------------------------------------------
// Copyright (c) 2011-2012 Don Williamson & clReflect Authors (see AUTHORS file)
// Released under MIT License (see LICENSE file)
// ===============================================================================
//

#include "Diagnostics.h"
#include "Logging.h"


const char* clent::GetDiagnosticCodeName(DiagnosticCode code)
{
	switch (code)
	{
	case (DIAG_NONE): return "none";
	case (DIAG_MISSING_QUALIFIED_NAME): return "missing-qualified-name";
	case (DIAG_UNRESOLVED_TYPE): return "unresolved-type";
	case (DIAG_UNRESOLVED_ANNOTATION_REFERENCE): return "unresolved-annotation-reference";
	case (DIAG_INTERNAL_FAILURE): return "internal-failure";
	case (DIAG_MISSING_KEY): return "missing-key";
	case (DIAG_MULTIPLE_VERSION): return "multiple-version";
	case (DIAG_TO_MANY_NOT_COLLECTION): return "to-many-not-collection";
	case (DIAG_DANGLING_RELATIONSHIP): return "dangling-relationship";
	case (DIAG_MULTIPLE_CARDINALITY): return "multiple-cardinality";
	case (DIAG_INVALID_ENTITY_NAME): return "invalid-entity-name";
	case (DIAG_EMPTY_ENTITY): return "empty-entity";
	case (DIAG_LONE_GENERATED_KEY): return "lone-generated-key";
	case (DIAG_RESERVED_TABLE_NAME): return "reserved-table-name";
	}
	return "unknown";
}


bool clent::HasErrors(const DiagnosticList& diagnostics)
{
	for (size_t i = 0; i < diagnostics.size(); i++)
	{
		if (diagnostics[i].severity == SEVERITY_ERROR)
			return true;
	}
	return false;
}


size_t clent::CountDiagnostics(const DiagnosticList& diagnostics, DiagnosticCode code)
{
	size_t count = 0;
	for (size_t i = 0; i < diagnostics.size(); i++)
	{
		if (diagnostics[i].code == code)
			count++;
	}
	return count;
}


void clent::PrintDiagnostics(const DiagnosticList& diagnostics)
{
	size_t nb_errors = 0, nb_warnings = 0;
	for (size_t i = 0; i < diagnostics.size(); i++)
	{
		const Diagnostic& diag = diagnostics[i];

		const char* severity = "note";
		switch (diag.severity)
		{
		case (SEVERITY_ERROR): severity = "error"; nb_errors++; break;
		case (SEVERITY_WARNING): severity = "warning"; nb_warnings++; break;
		default: break;
		}

		// Fall back to the subject when there's no source location
		const char* filename = diag.filename != "" ? diag.filename.c_str() : diag.subject.c_str();
		LOG(diag, INFO, "%s(%d) : %s - %s [%s]\n", filename, diag.line, severity, diag.message.c_str(), GetDiagnosticCodeName(diag.code));
	}

	if (diagnostics.size())
		LOG(diag, INFO, "%d error(s), %d warning(s)\n", (int)nb_errors, (int)nb_warnings);
}
