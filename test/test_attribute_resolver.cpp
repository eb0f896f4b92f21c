#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using namespace column_lineage;
using namespace column_lineage::test;

TEST_CASE("Column ids are unique and never invalid", "[resolver]") {
	ColumnIdGenerator ids;
	auto first = ids.NextId();
	auto second = ids.NextId();
	REQUIRE(first != INVALID_COLUMN_ID);
	REQUIRE(second != first);
}

TEST_CASE("References resolve against the scope", "[resolver]") {
	AttributeResolver resolver;
	ColumnLineage scope;
	ColumnSourceSet sources;
	sources.insert(SourceColumnRef(QualifiedName("db", "t"), "a"));
	scope[7] = sources;

	REQUIRE(resolver.Resolve(ColumnRefExpression(7, "a"), scope) == sources);
	REQUIRE_THROWS_AS(resolver.Resolve(ColumnRefExpression(8, "b"), scope), InvalidPlanException);
	REQUIRE_THROWS_AS(resolver.Resolve(ColumnRefExpression(INVALID_COLUMN_ID, "c"), scope),
	                  UnresolvedPlanException);
}

TEST_CASE("Identities are read by position", "[resolver]") {
	AttributeResolver resolver;
	TestPlanBuilder builder;
	auto t = builder.Table("t", {"a", "b"});

	REQUIRE(resolver.IdentityOf(*t, 1) == t->columns[1].id);
	REQUIRE_THROWS_AS(resolver.IdentityOf(*t, 2), InvalidPlanException);
	REQUIRE_NOTHROW(resolver.ValidateOutputs(*t));

	RelationNode unresolved(QualifiedName("", "t"), std::vector<OutputColumn> {OutputColumn(INVALID_COLUMN_ID, "a")});
	REQUIRE_THROWS_AS(resolver.ValidateOutputs(unresolved), UnresolvedPlanException);
}

TEST_CASE("Definitions remap positionally onto their references", "[resolver]") {
	AttributeResolver resolver;
	TestPlanBuilder builder;
	auto definition = builder.Table("t", {"a", "b"});
	auto reference = builder.Table("v", {"x", "y"});

	ColumnLineage definition_scope;
	definition_scope[definition->columns[0].id].insert(SourceColumnRef(QualifiedName("", "t"), "a"));
	definition_scope[definition->columns[1].id].insert(SourceColumnRef(QualifiedName("", "t"), "b"));

	ColumnLineage target_scope;
	resolver.Remap(*definition, definition_scope, *reference, target_scope);
	REQUIRE(target_scope.size() == 2);
	REQUIRE(target_scope[reference->columns[1].id].begin()->column == "b");

	auto narrow = builder.Table("w", {"x"});
	REQUIRE_THROWS_AS(resolver.Remap(*definition, definition_scope, *narrow, target_scope), InvalidPlanException);
}
